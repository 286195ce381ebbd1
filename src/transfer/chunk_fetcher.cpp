#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ffdl/chunk_fetcher.hpp>
#include <ffdl/http_client.hpp>
#include <ffdl/observer.hpp>
#include <ffdl/output_file.hpp>
#include <ffdl/transfer_state.hpp>

#include "utils.hpp"

namespace ffdl {

namespace {

// "bytes <start>-<end>/<size|*>" must name exactly the requested window
bool content_range_matches(std::string_view value, const ByteRange &range) {
	constexpr std::string_view kUnit = "bytes ";
	if (value.substr(0, kUnit.size()) != kUnit) return false;
	value.remove_prefix(kUnit.size());

	auto dash = value.find('-');
	auto slash = value.find('/');
	if (dash == std::string_view::npos || slash == std::string_view::npos ||
		slash < dash) {
		return false;
	}
	auto start = utils::to_u64(value.substr(0, dash));
	auto end = utils::to_u64(value.substr(dash + 1, slash - dash - 1));
	if (!start || !end) return false;
	return start.value() == range.start && end.value() == range.end;
}

}  // namespace

ChunkFetcher::ChunkFetcher(std::shared_ptr<net::HttpClient> http,
						   std::shared_ptr<const ControlFlag> flag,
						   std::shared_ptr<TransferState> state,
						   std::shared_ptr<SessionObserver> observer,
						   ChunkOptions options)
	: http_(std::move(http)),
	  flag_(std::move(flag)),
	  state_(std::move(state)),
	  observer_(std::move(observer)),
	  options_(options) {}

ChunkResult ChunkFetcher::fetch(std::string_view url, const ByteRange &range,
								const OutputFile &file, std::size_t chunk_num,
								std::size_t chunk_count) const {
	const int max_attempts = std::max(options_.retry.max_attempts, 1);

	for (int attempt_idx = 0; attempt_idx < max_attempts; ++attempt_idx) {
		auto res = attempt(url, range, file);
		if (res) return res.value();

		std::error_code ec = res.error();
		if (ec == errc::cancelled) {
			return outcome::failure(ChunkError{range, ec, attempt_idx + 1});
		}

		const char *kind = is_network_error(ec) ? "network error" : "error";
		if (attempt_idx + 1 == max_attempts) {
			log(fmt::format("Chunk {}/{} failed after {} attempts due to {}: {}",
							chunk_num, chunk_count, max_attempts, kind,
							ec.message()));
			return outcome::failure(ChunkError{range, ec, max_attempts});
		}

		log(fmt::format("Retrying chunk {}/{} (attempt {}/{}) - {}: {}",
						chunk_num, chunk_count, attempt_idx + 1, max_attempts,
						kind, ec.message()));

		auto backoff = options_.retry.backoff_unit * (1 + attempt_idx);
		if (!flag_->sleep_unless_stopped(backoff)) {
			return outcome::failure(ChunkError{
				range, make_error_code(errc::cancelled), attempt_idx + 1});
		}
	}
	return outcome::failure(
		ChunkError{range, make_error_code(errc::unknown), max_attempts});
}

Result<std::uint64_t> ChunkFetcher::attempt(std::string_view url,
											const ByteRange &range,
											const OutputFile &file) const {
	if (!wait_if_paused()) return outcome::failure(errc::cancelled);

	net::Headers headers{
		{"Range", fmt::format("bytes={}-{}", range.start, range.end)}};

	net::RequestOptions request;
	request.timeout = options_.timeout;
	request.read_block = options_.read_block;

	const std::uint64_t expected = range.length();
	std::uint64_t received = 0;
	std::error_code local;
	bool stopped = false;

	auto res = http_->stream(
		url, headers, request,
		[&local, &range](const net::HttpResponse &head) {
			if (head.status_code == 206) {
				auto cr = head.header("content-range");
				if (!cr || content_range_matches(*cr, range)) return true;
				spdlog::debug("Asked for bytes {}-{}, got {}", range.start,
							  range.end, *cr);
				local = make_error_code(errc::range_not_honored);
				return false;
			}
			local = make_error_code(head.status_code == 200
										? errc::range_not_honored
										: errc::http_error);
			spdlog::debug("Range request answered with {}", head.status_code);
			return false;
		},
		[&](const char *data, std::size_t size) {
			if (!wait_if_paused()) {
				stopped = true;
				return false;
			}
			if (received + size > expected) {
				local = make_error_code(errc::incomplete_chunk);
				return false;
			}
			auto written = file.write_at(range.start + received, data, size);
			if (!written) {
				local = written.error();
				return false;
			}
			received += size;
			return true;
		});

	if (stopped) return outcome::failure(errc::cancelled);
	if (!res) return local ? local : res.error();
	if (received != expected) {
		spdlog::debug("Range {}-{}: got {} of {} bytes", range.start,
					  range.end, received, expected);
		return outcome::failure(errc::incomplete_chunk);
	}
	return received;
}

bool ChunkFetcher::wait_if_paused() const {
	RunState s = flag_->state();
	if (s == RunState::paused) {
		if (state_) state_->mark_paused();
		s = flag_->wait_while_paused(options_.poll_interval);
		if (state_) state_->mark_resumed();
	}
	return s != RunState::stopped;
}

void ChunkFetcher::log(const std::string &message) const {
	if (observer_) {
		observer_->on_log(message);
	} else {
		spdlog::warn("{}", message);
	}
}

}  // namespace ffdl
