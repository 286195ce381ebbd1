#include <ffdl/control_flag.hpp>

namespace ffdl {

const char *to_string(RunState s) {
	switch (s) {
		case RunState::running: return "running";
		case RunState::paused: return "paused";
		case RunState::stopped: return "stopped";
	}
	return "unknown";
}

bool ControlFlag::set(RunState s) {
	{
		std::lock_guard lock(mutex_);
		if (state_.load(std::memory_order_relaxed) == RunState::stopped) {
			return false;
		}
		state_.store(s, std::memory_order_release);
	}
	cv_.notify_all();
	return true;
}

RunState ControlFlag::wait_while_paused(std::chrono::milliseconds slice) const {
	RunState s = state();
	while (s == RunState::paused) { s = wait_slice(slice); }
	return s;
}

RunState ControlFlag::wait_slice(std::chrono::milliseconds slice) const {
	std::unique_lock lock(mutex_);
	cv_.wait_for(lock, slice, [this] {
		return state_.load(std::memory_order_relaxed) != RunState::paused;
	});
	return state_.load(std::memory_order_relaxed);
}

bool ControlFlag::sleep_unless_stopped(std::chrono::milliseconds d) const {
	std::unique_lock lock(mutex_);
	return !cv_.wait_for(lock, d, [this] {
		return state_.load(std::memory_order_relaxed) == RunState::stopped;
	});
}

}  // namespace ffdl
