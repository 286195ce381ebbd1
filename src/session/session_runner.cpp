#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <ffdl/http_client.hpp>
#include <ffdl/observer.hpp>
#include <ffdl/session.hpp>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>
#include <utility>

#include "utils.hpp"

namespace ffdl {

namespace fs = std::filesystem;

const char *to_string(SessionState s) {
	switch (s) {
		case SessionState::idle: return "idle";
		case SessionState::running: return "running";
		case SessionState::paused: return "paused";
		case SessionState::stopping: return "stopping";
		case SessionState::finished: return "finished";
	}
	return "unknown";
}

namespace {

// Everything one session touches. Shared with the session thread so a
// detached thread never outlives its state.
struct SessionContext {
	std::shared_ptr<net::HttpClient> http;
	std::shared_ptr<SessionObserver> observer;
	SessionOptions options;
	std::shared_ptr<ControlFlag> flag = std::make_shared<ControlFlag>();

	std::atomic<SessionState> state{SessionState::idle};
	std::atomic<bool> finished_emitted{false};

	mutable std::mutex mutex;
	std::condition_variable exited_cv;
	bool exited = false;
	SessionOutcome outcome;
	std::optional<std::string> current_link;
	TransferCoordinator *active = nullptr;

	SessionContext(std::shared_ptr<net::HttpClient> h,
				   std::shared_ptr<SessionObserver> o, SessionOptions opts)
		: http(std::move(h)), observer(std::move(o)), options(std::move(opts)) {}

	void log(const std::string &message) const {
		if (observer) {
			observer->on_log(message);
		} else {
			spdlog::info("{}", message);
		}
	}

	void status(const std::string &text) const {
		if (observer) observer->on_status(text);
	}

	// running <-> paused only; stopping and finished stay put
	void move_state(SessionState from, SessionState to) {
		state.compare_exchange_strong(from, to);
	}

	void set_current(std::optional<std::string> link) {
		std::lock_guard lock(mutex);
		current_link = std::move(link);
	}

	void record_completed(const std::string &link) {
		{
			std::lock_guard lock(mutex);
			outcome.completed.push_back(link);
		}
		if (observer) observer->on_link_completed(link);
	}

	void record_failed(const std::string &link, std::string error) {
		log(fmt::format("Failed {}: {}", utils::shorten(link, 60), error));
		{
			std::lock_guard lock(mutex);
			outcome.failed.push_back({link, error});
		}
		if (observer) observer->on_link_failed(link, error);
	}

	SessionOutcome snapshot() const {
		std::lock_guard lock(mutex);
		return outcome;
	}

	void emit_finished() {
		if (finished_emitted.exchange(true)) return;
		if (observer) observer->on_session_finished(snapshot());
	}

	void mark_exited() {
		{
			std::lock_guard lock(mutex);
			exited = true;
		}
		exited_cv.notify_all();
	}
};

std::string describe(const std::error_code &ec) {
	return fmt::format("{}: {}",
					   is_network_error(ec) ? "Network error" : "General error",
					   ec.message());
}

void process_link(SessionContext &ctx, const LinkResolver &resolver,
				  const std::string &link) {
	if (ctx.observer) ctx.observer->on_link_started(link);
	ctx.log(fmt::format("Fetching content for: {}", utils::shorten(link, 60)));

	auto target = resolver.resolve(link);
	if (ctx.flag->is_stopped()) return;
	if (!target) {
		ctx.record_failed(link, describe(target.error()));
		return;
	}

	const auto &resolved = target.value();
	if (ctx.observer) ctx.observer->on_current_file(resolved.filename);
	ctx.status(fmt::format("Downloading: {}", resolved.filename));
	ctx.log(fmt::format("Downloading {}", resolved.filename));

	std::error_code fs_ec;
	fs::create_directories(ctx.options.download_dir, fs_ec);
	if (fs_ec) {
		ctx.record_failed(
			link, fmt::format("General error: cannot create {}: {}",
							  ctx.options.download_dir.string(),
							  fs_ec.message()));
		return;
	}

	TransferCoordinator coordinator(ctx.http, ctx.flag, ctx.observer,
									ctx.options.transfer);
	{
		std::lock_guard lock(ctx.mutex);
		ctx.active = &coordinator;
	}
	auto report = coordinator.run(resolved.direct_url,
								  ctx.options.download_dir / resolved.filename);
	{
		std::lock_guard lock(ctx.mutex);
		ctx.active = nullptr;
	}

	if (report) {
		const auto &r = report.value();
		ctx.log(fmt::format(
			"Download completed: {} ({:.2f} MB in {:.1f}s, avg {})",
			resolved.filename, utils::to_mib(r.bytes_written),
			std::chrono::duration<double>(r.active_time).count(),
			utils::format_speed(r.average_bps)));
		ctx.record_completed(link);
		return;
	}
	if (report.error() == errc::cancelled) {
		ctx.log(fmt::format("Download of {} cancelled", resolved.filename));
		return;
	}
	ctx.record_failed(link, describe(report.error()));
}

void run_session(SessionContext &ctx, const std::vector<std::string> &links) {
	ctx.state = SessionState::running;
	ctx.status("Running");
	ctx.log(fmt::format("Starting download session ({} links)", links.size()));

	try {
		const LinkResolver resolver(ctx.http, ctx.options.resolve_timeout);
		for (std::size_t i = 0; i < links.size(); ++i) {
			RunState s = ctx.flag->wait_while_paused(ctx.options.poll_interval);
			if (s == RunState::stopped) {
				ctx.log("Session interrupted.");
				break;
			}

			ctx.set_current(links[i]);
			ctx.log(fmt::format("Processing link {}/{}", i + 1, links.size()));
			try {
				process_link(ctx, resolver, links[i]);
			} catch (const std::exception &e) {
				ctx.record_failed(links[i],
								  fmt::format("General error: {}", e.what()));
			}
			ctx.set_current(std::nullopt);
			if (ctx.observer) ctx.observer->on_current_file("");
			if (ctx.flag->is_stopped()) {
				ctx.log("Session interrupted.");
				break;
			}
		}
	} catch (const std::exception &e) {
		spdlog::error("Session aborted: {}", e.what());
		ctx.log(fmt::format("Session aborted: {}", e.what()));
	}

	const auto outcome = ctx.snapshot();
	ctx.log(fmt::format("Session finished: {} completed, {} failed",
						outcome.completed.size(), outcome.failed.size()));
	for (const auto &f : outcome.failed) {
		ctx.log(fmt::format("  failed: {} ({})", f.link, f.error));
	}
	ctx.status("Idle");
	ctx.state = SessionState::finished;
	ctx.emit_finished();
}

}  // namespace

struct SessionRunner::Impl {
	std::shared_ptr<net::HttpClient> http;
	std::shared_ptr<SessionObserver> observer;
	SessionOptions options;

	mutable std::mutex mutex;
	std::shared_ptr<SessionContext> current;
	std::thread thread;

	std::shared_ptr<SessionContext> make_context() const {
		return std::make_shared<SessionContext>(http, observer, options);
	}

	std::shared_ptr<SessionContext> context() const {
		std::lock_guard lock(mutex);
		return current;
	}
};

SessionRunner::SessionRunner(std::shared_ptr<net::HttpClient> http,
							 std::shared_ptr<SessionObserver> observer,
							 SessionOptions options)
	: m_impl(std::make_unique<Impl>()) {
	m_impl->http = std::move(http);
	m_impl->observer = std::move(observer);
	m_impl->options = std::move(options);
}

SessionRunner::~SessionRunner() { stop(); }

void SessionRunner::start(std::vector<std::string> links) {
	stop();

	auto ctx = m_impl->make_context();
	ctx->state = SessionState::running;
	std::lock_guard lock(m_impl->mutex);
	m_impl->current = ctx;
	m_impl->thread = std::thread([ctx, links = std::move(links)] {
		run_session(*ctx, links);
		ctx->mark_exited();
	});
}

SessionOutcome SessionRunner::run(const std::vector<std::string> &links) {
	stop();

	auto ctx = m_impl->make_context();
	{
		std::lock_guard lock(m_impl->mutex);
		m_impl->current = ctx;
	}
	run_session(*ctx, links);
	ctx->mark_exited();
	return ctx->snapshot();
}

void SessionRunner::pause() {
	auto ctx = m_impl->context();
	if (!ctx || ctx->state == SessionState::finished) return;
	if (!ctx->flag->set(RunState::paused)) return;
	{
		std::lock_guard lock(ctx->mutex);
		if (ctx->active) ctx->active->pause();
	}
	ctx->move_state(SessionState::running, SessionState::paused);
	ctx->status("Paused");
	ctx->log("Download paused.");
}

void SessionRunner::resume() {
	auto ctx = m_impl->context();
	if (!ctx || ctx->state == SessionState::finished) return;
	if (!ctx->flag->set(RunState::running)) return;
	{
		std::lock_guard lock(ctx->mutex);
		if (ctx->active) ctx->active->resume();
	}
	ctx->move_state(SessionState::paused, SessionState::running);
	ctx->status("Running");
	ctx->log("Download resumed.");
}

bool SessionRunner::stop() {
	std::shared_ptr<SessionContext> ctx;
	std::thread thread;
	{
		std::lock_guard lock(m_impl->mutex);
		ctx = m_impl->current;
		thread = std::move(m_impl->thread);
	}
	if (!ctx) return true;

	if (ctx->flag->set(RunState::stopped) &&
		ctx->state != SessionState::finished) {
		ctx->move_state(SessionState::running, SessionState::stopping);
		ctx->move_state(SessionState::paused, SessionState::stopping);
		ctx->log("Stopping session...");
	}
	if (!thread.joinable()) return true;

	bool exited = false;
	{
		std::unique_lock lock(ctx->mutex);
		exited = ctx->exited_cv.wait_for(lock, m_impl->options.stop_grace,
										 [&] { return ctx->exited; });
	}
	if (exited) {
		thread.join();
		return true;
	}

	spdlog::warn("Session thread did not exit within {} ms, detaching",
				 m_impl->options.stop_grace.count());
	thread.detach();
	ctx->emit_finished();
	return false;
}

void SessionRunner::wait() {
	std::thread thread;
	{
		std::lock_guard lock(m_impl->mutex);
		thread = std::move(m_impl->thread);
	}
	if (thread.joinable()) thread.join();
}

SessionState SessionRunner::state() const {
	auto ctx = m_impl->context();
	return ctx ? ctx->state.load() : SessionState::idle;
}

std::optional<std::string> SessionRunner::current_link() const {
	auto ctx = m_impl->context();
	if (!ctx) return std::nullopt;
	std::lock_guard lock(ctx->mutex);
	return ctx->current_link;
}

const SessionOptions &SessionRunner::options() const {
	return m_impl->options;
}

void to_json(nlohmann::json &j, const FailedLink &failed) {
	j = nlohmann::json{{"link", failed.link}, {"error", failed.error}};
}

void to_json(nlohmann::json &j, const SessionOutcome &outcome) {
	j = nlohmann::json{{"completed", outcome.completed},
					   {"failed", outcome.failed}};
}

}  // namespace ffdl
