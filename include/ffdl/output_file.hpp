#pragma once

#include <ffdl/ffdl_export.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>

#include "result.hpp"

namespace ffdl {

/// Destination file opened for random-access writing. write_at() may be
/// called concurrently from several threads as long as their byte windows
/// do not overlap; append() is for single-threaded sequential use.
class FFDL_EXPORT OutputFile {
   public:
	OutputFile(const OutputFile &) = delete;
	OutputFile &operator=(const OutputFile &) = delete;
	OutputFile(OutputFile &&other) noexcept;
	OutputFile &operator=(OutputFile &&other) noexcept;
	~OutputFile();

	/// Create or truncate `path` and size it to `size` bytes (sparse where
	/// the filesystem allows).
	static Result<OutputFile> create(const std::filesystem::path &path,
									 std::uint64_t size = 0);

	Result<void> write_at(std::uint64_t offset, const char *data,
						  std::size_t size) const;
	Result<void> append(const char *data, std::size_t size);

	Result<void> close();

	[[nodiscard]] bool is_open() const;
	[[nodiscard]] const std::filesystem::path &path() const { return path_; }

   private:
#ifdef _WIN32
	using native_handle_type = void *;
#else
	using native_handle_type = int;
#endif

	OutputFile(std::filesystem::path path, native_handle_type handle);

	std::filesystem::path path_;
	native_handle_type handle_;
	std::uint64_t append_offset_ = 0;
};

}  // namespace ffdl
