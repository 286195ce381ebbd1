#pragma once

#include <ffdl/ffdl_export.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace ffdl {

enum class RunState : std::uint8_t { running, paused, stopped };

FFDL_EXPORT const char *to_string(RunState s);

/// Running/Paused/Stopped signal shared by one session and all of its
/// workers. The owner holds a std::shared_ptr<ControlFlag>; workers get a
/// std::shared_ptr<const ControlFlag> and can only observe it.
/// Stopped is terminal.
class FFDL_EXPORT ControlFlag {
   public:
	static constexpr auto kPollInterval = std::chrono::milliseconds(100);

	ControlFlag() = default;
	ControlFlag(const ControlFlag &) = delete;
	ControlFlag &operator=(const ControlFlag &) = delete;

	[[nodiscard]] RunState state() const {
		return state_.load(std::memory_order_acquire);
	}
	[[nodiscard]] bool is_paused() const {
		return state() == RunState::paused;
	}
	[[nodiscard]] bool is_stopped() const {
		return state() == RunState::stopped;
	}

	// Returns false when the flag was already stopped
	bool set(RunState s);

	/// Block while paused, waking at least every `slice` so the caller's
	/// loop can do its bookkeeping. Returns the state that ended the wait.
	RunState wait_while_paused(
		std::chrono::milliseconds slice = kPollInterval) const;

	/// Wait one slice if paused; returns the current state.
	RunState wait_slice(std::chrono::milliseconds slice = kPollInterval) const;

	/// Sleep for `d` unless stopped first. Returns false if stopped.
	bool sleep_unless_stopped(std::chrono::milliseconds d) const;

   private:
	std::atomic<RunState> state_{RunState::running};
	mutable std::mutex mutex_;
	mutable std::condition_variable cv_;
};

}  // namespace ffdl
