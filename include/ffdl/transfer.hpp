#pragma once

#include <ffdl/ffdl_export.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include "chunk_fetcher.hpp"
#include "control_flag.hpp"
#include "range_planner.hpp"
#include "result.hpp"
#include "types.hpp"

namespace ffdl::net {
class HttpClient;
}

namespace ffdl {

class SessionObserver;
class TransferState;

struct FFDL_EXPORT TransferOptions {
	std::uint64_t chunk_size = kDefaultChunkSize;
	// Files must be strictly larger than this to be split into chunks
	std::uint64_t chunked_threshold = kMiB;
	std::size_t max_workers = 6;
	std::size_t chunk_read_block = 256 * 1024;
	std::size_t stream_read_block = 1024 * 1024;
	std::chrono::seconds probe_timeout{10};
	std::chrono::seconds transfer_timeout{15};
	RetryPolicy retry;
	std::chrono::milliseconds poll_interval = ControlFlag::kPollInterval;
	// Progress log lines: at most one per interval unless log_bytes passed
	std::chrono::milliseconds log_interval{5000};
	std::uint64_t log_bytes = 5 * kMiB;
	// When false, exhausted chunks are logged and the transfer still
	// succeeds with the holes listed in TransferReport::failed_chunks
	bool fail_on_incomplete = true;
};

struct FFDL_EXPORT TransferReport {
	TransferStrategy strategy = TransferStrategy::single_stream;
	std::uint64_t bytes_written = 0;
	std::uint64_t total_bytes = 0;
	std::chrono::steady_clock::duration active_time{};
	double average_bps = 0.0;
	std::vector<ByteRange> failed_chunks;
};

/// Owns the download of one file: probes it, then either fans byte ranges
/// out over a thread pool or streams it in one request.
///
/// run() blocks the calling thread. pause(), resume() and cancel() may be
/// called from any other thread while it runs.
class FFDL_EXPORT TransferCoordinator {
   public:
	TransferCoordinator(const TransferCoordinator &) = delete;
	TransferCoordinator &operator=(const TransferCoordinator &) = delete;
	TransferCoordinator(TransferCoordinator &&) noexcept;
	TransferCoordinator &operator=(TransferCoordinator &&) noexcept;
	~TransferCoordinator();

	// A null flag gives the coordinator a private one
	TransferCoordinator(std::shared_ptr<net::HttpClient> http,
						std::shared_ptr<ControlFlag> flag,
						std::shared_ptr<SessionObserver> observer,
						TransferOptions options = {});

	[[nodiscard]] static TransferStrategy select_strategy(
		const ProbeResult &probe, const TransferOptions &options = {});

	/// Download `url` into `destination`, truncating an existing file.
	/// Fails with errc::cancelled once the flag is stopped.
	Result<TransferReport> run(std::string_view url,
							   const std::filesystem::path &destination);

	void pause();
	void resume();
	void cancel();

	[[nodiscard]] std::shared_ptr<const TransferState> state() const;
	[[nodiscard]] const TransferOptions &options() const;

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

}  // namespace ffdl
