#pragma once

#include <ffdl/ffdl_export.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

#include "types.hpp"

namespace ffdl {

/// Progress and pause-aware clock of one transfer. Thread-safe: chunk
/// workers and the coordinator both mark pauses, and the marks are
/// idempotent so an interval observed by several threads counts once.
class FFDL_EXPORT TransferState {
   public:
	using clock = std::chrono::steady_clock;

	// Current speed is only resampled after this much wall time
	static constexpr auto kSampleGranularity = std::chrono::milliseconds(100);

	void begin(std::uint64_t total_bytes, clock::time_point now = clock::now());
	void set_total(std::uint64_t total_bytes);
	// Freezes the active clock; ETA becomes unavailable
	void finish(clock::time_point now = clock::now());

	// Never moves backwards; capped at the total once it is known
	void record(std::uint64_t downloaded);

	// Return true when this call opened/closed the pause interval
	bool mark_paused(clock::time_point now = clock::now());
	bool mark_resumed(clock::time_point now = clock::now());

	SpeedSample sample(clock::time_point now = clock::now());

	[[nodiscard]] clock::duration active_elapsed(
		clock::time_point now = clock::now()) const;
	[[nodiscard]] clock::duration paused_duration(
		clock::time_point now = clock::now()) const;

	[[nodiscard]] std::uint64_t downloaded() const;
	[[nodiscard]] std::uint64_t total() const;
	[[nodiscard]] bool paused() const;
	[[nodiscard]] bool active() const;

   private:
	clock::duration paused_locked(clock::time_point now) const;
	clock::duration active_locked(clock::time_point now) const;

	mutable std::mutex mutex_;
	std::uint64_t total_ = 0;
	std::uint64_t downloaded_ = 0;
	clock::time_point start_{};
	clock::duration accumulated_paused_{};
	std::optional<clock::time_point> pause_started_;
	std::optional<clock::time_point> finished_at_;
	clock::time_point last_sample_time_{};
	std::uint64_t last_sample_bytes_ = 0;
	double current_bps_ = 0.0;
	bool active_ = false;
};

}  // namespace ffdl
