#pragma once

#include <ffdl/ffdl_export.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

#include "control_flag.hpp"
#include "link_resolver.hpp"
#include "transfer.hpp"
#include "types.hpp"

namespace ffdl::net {
class HttpClient;
}

namespace ffdl {

class SessionObserver;

enum class SessionState : std::uint8_t {
	idle,
	running,
	paused,
	stopping,
	finished
};

FFDL_EXPORT const char *to_string(SessionState s);

struct FFDL_EXPORT SessionOptions {
	std::filesystem::path download_dir = "downloads";
	TransferOptions transfer;
	std::chrono::seconds resolve_timeout = LinkResolver::kPageTimeout;
	// How long stop() waits for the session thread before detaching it
	std::chrono::milliseconds stop_grace{2000};
	std::chrono::milliseconds poll_interval = ControlFlag::kPollInterval;
};

/// Processes a list of links in order: resolve, then transfer into the
/// download directory. A failing link is recorded and the session moves
/// on; only stop() ends a session early.
///
/// on_session_finished() fires exactly once per start()/run().
class FFDL_EXPORT SessionRunner {
   public:
	SessionRunner(std::shared_ptr<net::HttpClient> http,
				  std::shared_ptr<SessionObserver> observer,
				  SessionOptions options = {});
	SessionRunner(const SessionRunner &) = delete;
	SessionRunner &operator=(const SessionRunner &) = delete;
	// Stops a running session
	~SessionRunner();

	/// Run the session on a background thread. A session that is still
	/// running is stopped first.
	void start(std::vector<std::string> links);

	/// Run the session on the calling thread and return its outcome.
	SessionOutcome run(const std::vector<std::string> &links);

	void pause();
	void resume();

	/// Returns false when the session thread had to be detached because it
	/// did not exit within SessionOptions::stop_grace.
	bool stop();

	// Join the background thread, if any
	void wait();

	[[nodiscard]] SessionState state() const;
	[[nodiscard]] std::optional<std::string> current_link() const;
	[[nodiscard]] const SessionOptions &options() const;

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

FFDL_EXPORT void to_json(nlohmann::json &j, const FailedLink &failed);
FFDL_EXPORT void to_json(nlohmann::json &j, const SessionOutcome &outcome);

}  // namespace ffdl
