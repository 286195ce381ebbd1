#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <condition_variable>
#include <ffdl/chunk_fetcher.hpp>
#include <ffdl/http_client.hpp>
#include <ffdl/observer.hpp>
#include <ffdl/output_file.hpp>
#include <ffdl/size_probe.hpp>
#include <ffdl/transfer.hpp>
#include <ffdl/transfer_state.hpp>
#include <mutex>
#include <utility>

#include "utils.hpp"

namespace ffdl {

namespace asio = boost::asio;

struct TransferCoordinator::Impl {
	using clock = TransferState::clock;

	std::shared_ptr<net::HttpClient> http;
	std::shared_ptr<ControlFlag> flag;
	std::shared_ptr<SessionObserver> observer;
	std::shared_ptr<TransferState> state = std::make_shared<TransferState>();
	TransferOptions options;

	clock::time_point last_log_time{};
	std::uint64_t last_log_bytes = 0;

	Impl(std::shared_ptr<net::HttpClient> h, std::shared_ptr<ControlFlag> f,
		 std::shared_ptr<SessionObserver> o, TransferOptions opts)
		: http(std::move(h)),
		  flag(f ? std::move(f) : std::make_shared<ControlFlag>()),
		  observer(std::move(o)),
		  options(opts) {}

	void log(const std::string &message) const {
		if (observer) {
			observer->on_log(message);
		} else {
			spdlog::info("{}", message);
		}
	}

	// Keeps the pause interval in step with the flag
	void track_pause() {
		if (flag->is_paused()) {
			state->mark_paused();
		} else {
			state->mark_resumed();
		}
	}

	void publish(bool force) {
		const auto now = clock::now();
		const auto sample = state->sample(now);
		const auto downloaded = state->downloaded();
		const auto total = state->total();

		if (observer) {
			observer->on_progress(downloaded, total);
			observer->on_speed(sample);
		}

		const bool due =
			now - last_log_time >= options.log_interval ||
			downloaded - last_log_bytes >= options.log_bytes;
		if (!force && !due) return;

		last_log_time = now;
		last_log_bytes = downloaded;
		log(fmt::format("Progress: {:.2f}/{:.2f} MB Speed: {} ETA: {}",
						utils::to_mib(downloaded), utils::to_mib(total),
						utils::format_speed(sample.current_bps),
						utils::format_eta(sample.eta_seconds)));
	}

	TransferReport finish(TransferStrategy strategy,
						  std::vector<ByteRange> failed) {
		state->finish();
		publish(true);

		TransferReport report;
		report.strategy = strategy;
		report.bytes_written = state->downloaded();
		report.total_bytes = state->total();
		report.active_time = state->active_elapsed();
		report.failed_chunks = std::move(failed);
		const double secs =
			std::chrono::duration<double>(report.active_time).count();
		if (secs > 0) {
			report.average_bps = static_cast<double>(report.bytes_written) / secs;
		}
		return report;
	}

	Result<TransferReport> run_chunked(std::string_view url,
									   const std::filesystem::path &dest,
									   std::uint64_t total);
	Result<TransferReport> run_single(std::string_view url,
									  const std::filesystem::path &dest,
									  std::uint64_t total);
};

TransferCoordinator::TransferCoordinator(
	std::shared_ptr<net::HttpClient> http, std::shared_ptr<ControlFlag> flag,
	std::shared_ptr<SessionObserver> observer, TransferOptions options)
	: m_impl(std::make_unique<Impl>(std::move(http), std::move(flag),
									std::move(observer), options)) {}

TransferCoordinator::TransferCoordinator(TransferCoordinator &&) noexcept =
	default;
TransferCoordinator &TransferCoordinator::operator=(
	TransferCoordinator &&) noexcept = default;
TransferCoordinator::~TransferCoordinator() = default;

TransferStrategy TransferCoordinator::select_strategy(
	const ProbeResult &probe, const TransferOptions &options) {
	if (probe.supports_ranges && probe.total_bytes > options.chunked_threshold) {
		return TransferStrategy::chunked;
	}
	return TransferStrategy::single_stream;
}

Result<TransferReport> TransferCoordinator::run(
	std::string_view url, const std::filesystem::path &destination) {
	auto &impl = *m_impl;
	if (impl.flag->is_stopped()) return outcome::failure(errc::cancelled);

	SizeProbe probe(impl.http, impl.options.probe_timeout);
	const ProbeResult info = probe.probe(url);
	impl.log(fmt::format("File size: {:.2f} MB", utils::to_mib(info.total_bytes)));

	// The destination is untouched until here
	if (impl.flag->wait_while_paused(impl.options.poll_interval) ==
		RunState::stopped) {
		impl.log("Download cancelled");
		return outcome::failure(errc::cancelled);
	}

	if (select_strategy(info, impl.options) == TransferStrategy::chunked) {
		return impl.run_chunked(url, destination, info.total_bytes);
	}
	impl.log("Server doesn't support chunked downloads, using single stream");
	return impl.run_single(url, destination, info.total_bytes);
}

Result<TransferReport> TransferCoordinator::Impl::run_chunked(
	std::string_view url, const std::filesystem::path &dest,
	std::uint64_t total) {
	auto file = OutputFile::create(dest, total);
	if (!file) {
		log(fmt::format("Cannot open {}: {}", dest.string(),
						file.error().message()));
		return file.error();
	}

	const auto ranges = plan_ranges(total, options.chunk_size);
	const std::size_t chunk_count = ranges.size();
	log(fmt::format("Using chunked download with {} chunks", chunk_count));

	state->begin(total);
	last_log_time = clock::now();
	last_log_bytes = 0;
	publish(false);

	ChunkOptions chunk_options;
	chunk_options.read_block = options.chunk_read_block;
	chunk_options.timeout = options.transfer_timeout;
	chunk_options.retry = options.retry;
	chunk_options.poll_interval = options.poll_interval;
	const ChunkFetcher fetcher(http, flag, state, observer, chunk_options);

	std::atomic<std::uint64_t> completed_bytes{0};
	std::mutex board_mutex;
	std::condition_variable board_cv;
	std::size_t finished = 0;
	std::vector<ChunkError> errors;

	const std::string url_s(url);
	const OutputFile &out = file.value();
	const auto workers = std::clamp<std::size_t>(
		std::min(options.max_workers, chunk_count), 1, 64);

	asio::thread_pool pool(workers);
	for (std::size_t i = 0; i < chunk_count; ++i) {
		asio::post(pool, [&, i] {
			auto res = fetcher.fetch(url_s, ranges[i], out, i + 1, chunk_count);
			std::lock_guard<std::mutex> lock(board_mutex);
			if (res) {
				completed_bytes.fetch_add(res.value(), std::memory_order_relaxed);
			} else {
				errors.push_back(res.error());
			}
			++finished;
			board_cv.notify_one();
		});
	}

	for (;;) {
		bool done = false;
		{
			std::unique_lock<std::mutex> lock(board_mutex);
			done = board_cv.wait_for(lock, options.poll_interval, [&] {
				return finished == chunk_count;
			});
		}
		track_pause();
		state->record(completed_bytes.load(std::memory_order_relaxed));
		if (done) break;
		publish(false);
	}
	pool.join();

	if (auto closed = file.value().close(); !closed) {
		log(fmt::format("Failed to close {}: {}", dest.string(),
						closed.error().message()));
		return closed.error();
	}

	if (flag->is_stopped()) {
		state->finish();
		log("Download cancelled");
		return outcome::failure(errc::cancelled);
	}

	std::vector<ByteRange> holes;
	for (const auto &err : errors) {
		if (err.cancelled()) continue;
		spdlog::warn("Chunk {}-{} failed: {}", err.range.start, err.range.end,
					 err.cause.message());
		log(fmt::format("Chunk bytes {}-{} could not be downloaded after {} "
						"attempts",
						err.range.start, err.range.end, err.attempts));
		holes.push_back(err.range);
	}
	std::sort(holes.begin(), holes.end(),
			  [](const ByteRange &a, const ByteRange &b) {
				  return a.start < b.start;
			  });

	auto report = finish(TransferStrategy::chunked, holes);
	if (!holes.empty() && options.fail_on_incomplete) {
		log(fmt::format("{} of {} chunks missing, download incomplete",
						holes.size(), chunk_count));
		return outcome::failure(errc::incomplete_transfer);
	}
	return report;
}

Result<TransferReport> TransferCoordinator::Impl::run_single(
	std::string_view url, const std::filesystem::path &dest,
	std::uint64_t total) {
	auto file = OutputFile::create(dest);
	if (!file) {
		log(fmt::format("Cannot open {}: {}", dest.string(),
						file.error().message()));
		return file.error();
	}

	state->begin(total);
	last_log_time = clock::now();
	last_log_bytes = 0;

	net::RequestOptions request;
	request.timeout = options.transfer_timeout;
	request.read_block = options.stream_read_block;

	std::uint64_t received = 0;
	std::error_code local;
	bool stopped = false;

	auto res = http->stream(
		url, {}, request,
		[&](const net::HttpResponse &head) {
			if (!head.ok()) {
				local = make_error_code(errc::http_error);
				log(fmt::format("Server answered with HTTP {}",
								head.status_code));
				return false;
			}
			if (state->total() == 0) {
				if (auto len = head.header("content-length")) {
					if (auto n = utils::to_u64(*len); n && n.value() > 0) {
						state->set_total(n.value());
					}
				}
			}
			return true;
		},
		[&](const char *data, std::size_t size) {
			for (;;) {
				RunState s = flag->wait_slice(options.poll_interval);
				track_pause();
				if (s == RunState::stopped) {
					stopped = true;
					return false;
				}
				if (s == RunState::running) break;
				publish(false);
			}
			if (auto w = file.value().append(data, size); !w) {
				local = w.error();
				return false;
			}
			received += size;
			state->record(received);
			publish(false);
			return true;
		});

	if (auto closed = file.value().close(); !closed && !local) {
		local = closed.error();
	}

	if (stopped || flag->is_stopped()) {
		state->finish();
		log("Download cancelled");
		return outcome::failure(errc::cancelled);
	}
	if (!res || local) {
		std::error_code ec = local ? local : res.error();
		state->finish();
		log(fmt::format("Download failed: {}", ec.message()));
		return ec;
	}

	if (state->total() == 0) state->set_total(received);
	state->record(received);
	return finish(TransferStrategy::single_stream, {});
}

void TransferCoordinator::pause() {
	if (m_impl->flag->set(RunState::paused)) m_impl->state->mark_paused();
}

void TransferCoordinator::resume() {
	if (m_impl->flag->set(RunState::running)) m_impl->state->mark_resumed();
}

void TransferCoordinator::cancel() { m_impl->flag->set(RunState::stopped); }

std::shared_ptr<const TransferState> TransferCoordinator::state() const {
	return m_impl->state;
}

const TransferOptions &TransferCoordinator::options() const {
	return m_impl->options;
}

}  // namespace ffdl
