#pragma once

#include <ffdl/ffdl_export.h>

#include <cstdint>
#include <string>

#include "types.hpp"

namespace ffdl {

/// Receives everything the engine reports. All methods default to no-ops.
/// Calls come from the session thread, except chunk retry log lines which
/// come from transfer pool threads: implementations must be thread-safe.
class FFDL_EXPORT SessionObserver {
   public:
	virtual ~SessionObserver() = default;

	virtual void on_log(const std::string & /*message*/) {}
	virtual void on_progress(std::uint64_t /*downloaded*/,
							 std::uint64_t /*total*/) {}
	virtual void on_current_file(const std::string & /*filename*/) {}
	virtual void on_status(const std::string & /*text*/) {}
	virtual void on_speed(const SpeedSample & /*sample*/) {}
	virtual void on_link_started(const std::string & /*link*/) {}
	virtual void on_link_completed(const std::string & /*link*/) {}
	virtual void on_link_failed(const std::string & /*link*/,
								const std::string & /*error*/) {}
	virtual void on_session_finished(const SessionOutcome & /*outcome*/) {}
};

}  // namespace ffdl
