#pragma once

#include <ffdl/ffdl_export.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include "control_flag.hpp"
#include "result.hpp"
#include "types.hpp"

namespace ffdl::net {
class HttpClient;
}

namespace ffdl {

class OutputFile;
class SessionObserver;
class TransferState;

struct FFDL_EXPORT ChunkError {
	ByteRange range;
	std::error_code cause;
	int attempts = 0;

	[[nodiscard]] bool cancelled() const { return cause == errc::cancelled; }
};

using ChunkResult =
	outcome::result<std::uint64_t, ChunkError, outcome::policy::terminate>;

struct FFDL_EXPORT RetryPolicy {
	int max_attempts = 3;
	// Attempt n (0-based) sleeps (1 + n) units before retrying
	std::chrono::milliseconds backoff_unit{1000};
};

struct FFDL_EXPORT ChunkOptions {
	std::size_t read_block = 256 * 1024;
	std::chrono::seconds timeout{15};
	RetryPolicy retry;
	std::chrono::milliseconds poll_interval = ControlFlag::kPollInterval;
};

/// Downloads one byte range into its window of a preallocated file.
class FFDL_EXPORT ChunkFetcher {
   public:
	ChunkFetcher(std::shared_ptr<net::HttpClient> http,
				 std::shared_ptr<const ControlFlag> flag,
				 std::shared_ptr<TransferState> state,
				 std::shared_ptr<SessionObserver> observer,
				 ChunkOptions options = {});

	/// Returns the number of bytes written, which always equals
	/// range.length(). chunk_num/chunk_count only label log lines.
	ChunkResult fetch(std::string_view url, const ByteRange &range,
					  const OutputFile &file, std::size_t chunk_num = 1,
					  std::size_t chunk_count = 1) const;

   private:
	Result<std::uint64_t> attempt(std::string_view url, const ByteRange &range,
								  const OutputFile &file) const;
	// False once the flag is stopped
	bool wait_if_paused() const;
	void log(const std::string &message) const;

	std::shared_ptr<net::HttpClient> http_;
	std::shared_ptr<const ControlFlag> flag_;
	std::shared_ptr<TransferState> state_;
	std::shared_ptr<SessionObserver> observer_;
	ChunkOptions options_;
};

}  // namespace ffdl
