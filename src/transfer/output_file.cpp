#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ffdl/output_file.hpp>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace ffdl {

namespace {

#ifdef _WIN32
const HANDLE kInvalidHandle = INVALID_HANDLE_VALUE;
#else
constexpr int kInvalidHandle = -1;
#endif

}  // namespace

OutputFile::OutputFile(std::filesystem::path path, native_handle_type handle)
	: path_(std::move(path)), handle_(handle) {}

OutputFile::OutputFile(OutputFile &&other) noexcept
	: path_(std::move(other.path_)),
	  handle_(std::exchange(other.handle_, kInvalidHandle)),
	  append_offset_(other.append_offset_) {}

OutputFile &OutputFile::operator=(OutputFile &&other) noexcept {
	if (this != &other) {
		(void)close();
		path_ = std::move(other.path_);
		handle_ = std::exchange(other.handle_, kInvalidHandle);
		append_offset_ = other.append_offset_;
	}
	return *this;
}

OutputFile::~OutputFile() {
	auto res = close();
	if (!res) {
		spdlog::warn("Closing {} failed: {}", path_.string(),
					 res.error().message());
	}
}

bool OutputFile::is_open() const { return handle_ != kInvalidHandle; }

#ifdef _WIN32

Result<OutputFile> OutputFile::create(const std::filesystem::path &path,
									  std::uint64_t size) {
	HANDLE h = CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE,
						   FILE_SHARE_READ, nullptr, CREATE_ALWAYS,
						   FILE_ATTRIBUTE_NORMAL, nullptr);
	if (h == INVALID_HANDLE_VALUE) {
		spdlog::error("Cannot open {} (error {})", path.string(),
					  GetLastError());
		return outcome::failure(errc::file_open_failed);
	}
	OutputFile file(path, h);
	if (size > 0) {
		LARGE_INTEGER li;
		li.QuadPart = static_cast<LONGLONG>(size);
		if (!SetFilePointerEx(h, li, nullptr, FILE_BEGIN) || !SetEndOfFile(h)) {
			return outcome::failure(errc::file_write_failed);
		}
	}
	return file;
}

Result<void> OutputFile::write_at(std::uint64_t offset, const char *data,
								  std::size_t size) const {
	while (size > 0) {
		OVERLAPPED ov{};
		ov.Offset = static_cast<DWORD>(offset & 0xFFFFFFFFu);
		ov.OffsetHigh = static_cast<DWORD>(offset >> 32);
		DWORD chunk = static_cast<DWORD>(std::min<std::size_t>(size, 1u << 30));
		DWORD written = 0;
		if (!WriteFile(handle_, data, chunk, &written, &ov) || written == 0) {
			return outcome::failure(errc::file_write_failed);
		}
		data += written;
		size -= written;
		offset += written;
	}
	return outcome::success();
}

Result<void> OutputFile::close() {
	if (handle_ == kInvalidHandle) return outcome::success();
	bool ok = CloseHandle(std::exchange(handle_, kInvalidHandle)) != 0;
	if (!ok) return outcome::failure(errc::file_write_failed);
	return outcome::success();
}

#else

Result<OutputFile> OutputFile::create(const std::filesystem::path &path,
									  std::uint64_t size) {
	int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
	if (fd < 0) {
		spdlog::error("Cannot open {}: {}", path.string(), std::strerror(errno));
		return outcome::failure(errc::file_open_failed);
	}
	OutputFile file(path, fd);
	if (size > 0 && ::ftruncate(fd, static_cast<off_t>(size)) != 0) {
		spdlog::error("Cannot preallocate {} bytes for {}: {}", size,
					  path.string(), std::strerror(errno));
		return outcome::failure(errc::file_write_failed);
	}
	return file;
}

Result<void> OutputFile::write_at(std::uint64_t offset, const char *data,
								  std::size_t size) const {
	while (size > 0) {
		ssize_t n = ::pwrite(handle_, data, size, static_cast<off_t>(offset));
		if (n < 0) {
			if (errno == EINTR) continue;
			spdlog::error("Write to {} at {} failed: {}", path_.string(), offset,
						  std::strerror(errno));
			return outcome::failure(errc::file_write_failed);
		}
		data += n;
		size -= static_cast<std::size_t>(n);
		offset += static_cast<std::uint64_t>(n);
	}
	return outcome::success();
}

Result<void> OutputFile::close() {
	if (handle_ == kInvalidHandle) return outcome::success();
	if (::close(std::exchange(handle_, kInvalidHandle)) != 0) {
		return outcome::failure(errc::file_write_failed);
	}
	return outcome::success();
}

#endif

Result<void> OutputFile::append(const char *data, std::size_t size) {
	auto res = write_at(append_offset_, data, size);
	if (res) append_offset_ += size;
	return res;
}

}  // namespace ffdl
