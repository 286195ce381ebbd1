#pragma once

#include <chrono>
#include <condition_variable>
#include <ffdl/observer.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace ffdl::test {

// Collects every event for later inspection
class RecordingObserver : public SessionObserver {
   public:
	void on_log(const std::string &message) override {
		std::lock_guard lock(mutex_);
		logs.push_back(message);
	}

	void on_progress(std::uint64_t downloaded, std::uint64_t total) override {
		std::lock_guard lock(mutex_);
		progress.emplace_back(downloaded, total);
	}

	void on_current_file(const std::string &filename) override {
		std::lock_guard lock(mutex_);
		files.push_back(filename);
	}

	void on_status(const std::string &text) override {
		std::lock_guard lock(mutex_);
		statuses.push_back(text);
	}

	void on_speed(const SpeedSample &sample) override {
		std::lock_guard lock(mutex_);
		speeds.push_back(sample);
	}

	void on_link_started(const std::string &link) override {
		std::lock_guard lock(mutex_);
		started.push_back(link);
		cv_.notify_all();
	}

	void on_link_completed(const std::string &link) override {
		std::lock_guard lock(mutex_);
		completed.push_back(link);
	}

	void on_link_failed(const std::string &link,
						const std::string &error) override {
		std::lock_guard lock(mutex_);
		failed.push_back({link, error});
	}

	void on_session_finished(const SessionOutcome &outcome) override {
		std::lock_guard lock(mutex_);
		finished.push_back(outcome);
		cv_.notify_all();
	}

	bool wait_finished(std::chrono::milliseconds timeout) {
		std::unique_lock lock(mutex_);
		return cv_.wait_for(lock, timeout, [this] { return !finished.empty(); });
	}

	bool wait_started(std::size_t count, std::chrono::milliseconds timeout) {
		std::unique_lock lock(mutex_);
		return cv_.wait_for(lock, timeout,
							[&] { return started.size() >= count; });
	}

	std::size_t finished_count() const {
		std::lock_guard lock(mutex_);
		return finished.size();
	}

	bool logged(const std::string &needle) const {
		std::lock_guard lock(mutex_);
		for (const auto &l : logs) {
			if (l.find(needle) != std::string::npos) return true;
		}
		return false;
	}

	std::vector<std::string> logs;
	std::vector<std::pair<std::uint64_t, std::uint64_t>> progress;
	std::vector<std::string> files;
	std::vector<std::string> statuses;
	std::vector<SpeedSample> speeds;
	std::vector<std::string> started;
	std::vector<std::string> completed;
	std::vector<FailedLink> failed;
	std::vector<SessionOutcome> finished;

   private:
	mutable std::mutex mutex_;
	std::condition_variable cv_;
};

}  // namespace ffdl::test
