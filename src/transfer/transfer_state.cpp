#include <algorithm>
#include <ffdl/transfer_state.hpp>

namespace ffdl {

namespace {
double seconds(TransferState::clock::duration d) {
	return std::chrono::duration<double>(d).count();
}
}  // namespace

void TransferState::begin(std::uint64_t total_bytes, clock::time_point now) {
	std::lock_guard lock(mutex_);
	total_ = total_bytes;
	downloaded_ = 0;
	start_ = now;
	accumulated_paused_ = {};
	pause_started_.reset();
	last_sample_time_ = now;
	last_sample_bytes_ = 0;
	current_bps_ = 0.0;
	finished_at_.reset();
	active_ = true;
}

void TransferState::set_total(std::uint64_t total_bytes) {
	std::lock_guard lock(mutex_);
	total_ = total_bytes;
	if (total_ > 0) downloaded_ = std::min(downloaded_, total_);
}

void TransferState::finish(clock::time_point now) {
	std::lock_guard lock(mutex_);
	if (pause_started_) {
		accumulated_paused_ += now - *pause_started_;
		pause_started_.reset();
	}
	finished_at_ = now;
	active_ = false;
}

void TransferState::record(std::uint64_t downloaded) {
	std::lock_guard lock(mutex_);
	if (total_ > 0) downloaded = std::min(downloaded, total_);
	downloaded_ = std::max(downloaded_, downloaded);
}

bool TransferState::mark_paused(clock::time_point now) {
	std::lock_guard lock(mutex_);
	if (pause_started_ || !active_) return false;
	pause_started_ = now;
	return true;
}

bool TransferState::mark_resumed(clock::time_point now) {
	std::lock_guard lock(mutex_);
	if (!pause_started_) return false;
	accumulated_paused_ += std::max(now - *pause_started_, clock::duration{});
	pause_started_.reset();
	// The next current-speed sample must not span the pause
	last_sample_time_ = now;
	last_sample_bytes_ = downloaded_;
	return true;
}

SpeedSample TransferState::sample(clock::time_point now) {
	std::lock_guard lock(mutex_);
	SpeedSample s;

	if (pause_started_) {
		current_bps_ = 0.0;
	} else if (now - last_sample_time_ > kSampleGranularity) {
		current_bps_ = static_cast<double>(downloaded_ - last_sample_bytes_) /
					   seconds(now - last_sample_time_);
		last_sample_time_ = now;
		last_sample_bytes_ = downloaded_;
	}
	s.current_bps = current_bps_;

	double elapsed = seconds(active_locked(now));
	if (elapsed > 0) s.overall_bps = static_cast<double>(downloaded_) / elapsed;

	if (active_ && s.overall_bps > 0 && total_ > 0) {
		s.eta_seconds = static_cast<double>(total_ - downloaded_) / s.overall_bps;
	}
	return s;
}

TransferState::clock::duration TransferState::paused_locked(
	clock::time_point now) const {
	auto d = accumulated_paused_;
	if (pause_started_) d += std::max(now - *pause_started_, clock::duration{});
	return d;
}

TransferState::clock::duration TransferState::active_locked(
	clock::time_point now) const {
	if (finished_at_) now = *finished_at_;
	auto d = now - start_ - paused_locked(now);
	return std::max(d, clock::duration{});
}

TransferState::clock::duration TransferState::active_elapsed(
	clock::time_point now) const {
	std::lock_guard lock(mutex_);
	return active_locked(now);
}

TransferState::clock::duration TransferState::paused_duration(
	clock::time_point now) const {
	std::lock_guard lock(mutex_);
	return paused_locked(now);
}

std::uint64_t TransferState::downloaded() const {
	std::lock_guard lock(mutex_);
	return downloaded_;
}

std::uint64_t TransferState::total() const {
	std::lock_guard lock(mutex_);
	return total_;
}

bool TransferState::paused() const {
	std::lock_guard lock(mutex_);
	return pause_started_.has_value();
}

bool TransferState::active() const {
	std::lock_guard lock(mutex_);
	return active_;
}

}  // namespace ffdl
