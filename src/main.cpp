#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <ffdl/http_client.hpp>
#include <ffdl/link_list.hpp>
#include <ffdl/observer.hpp>
#include <ffdl/session.hpp>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <utility>

// Windows headers for console
#ifdef _WIN32
#include <windows.h>
#endif

#include "cli/cli_options.hpp"

namespace asio = boost::asio;

// =============================================================================
// Console observer
// =============================================================================

// Renders session events through spdlog and keeps the link file in sync
class CliObserver : public ffdl::SessionObserver {
   public:
	explicit CliObserver(std::optional<std::filesystem::path> link_file)
		: link_file_(std::move(link_file)) {}

	void on_log(const std::string &message) override {
		spdlog::info("{}", message);
	}

	void on_status(const std::string &text) override {
		spdlog::debug("Status: {}", text);
	}

	void on_current_file(const std::string &filename) override {
		if (!filename.empty()) spdlog::debug("Current file: {}", filename);
	}

	void on_link_completed(const std::string &link) override {
		if (!link_file_) return;
		std::lock_guard lock(mutex_);
		if (auto res = ffdl::remove_link(*link_file_, link); !res) {
			spdlog::warn("Could not update {}: {}", link_file_->string(),
						 res.error().message());
		}
	}

	void on_link_failed(const std::string &link,
						const std::string &error) override {
		spdlog::debug("Link failed: {} ({})", link, error);
	}

   private:
	std::optional<std::filesystem::path> link_file_;
	std::mutex mutex_;
};

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char *argv[]) {
#ifdef _WIN32
	SetConsoleOutputCP(CP_UTF8);
#endif

	try {
		// Setup logging
		auto stderr_logger = spdlog::stderr_color_mt("ffdl");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[ffdl] %v");

		auto settings = ffdl::cli::parse_settings(argc, argv);

		if (settings.show_help) {
			std::cout << "Usage: ffdl [options] [url...]\n"
					  << ffdl::cli::visible_options() << "\n";
			return 0;
		}

		if (settings.verbose) {
			spdlog::set_level(spdlog::level::debug);
		} else if (settings.quiet) {
			spdlog::set_level(spdlog::level::warn);
		} else {
			spdlog::set_level(spdlog::level::info);
		}

		// Links: command line wins over the link file
		std::vector<std::string> links = settings.urls;
		std::optional<std::filesystem::path> link_file;
		if (links.empty()) {
			auto loaded = ffdl::load_links(settings.input_file);
			if (!loaded) {
				fmt::println(stderr, "ERROR: Cannot read {}: {}",
							 settings.input_file.string(),
							 loaded.error().message());
				return 1;
			}
			links = std::move(loaded.value());
			if (settings.update_input) link_file = settings.input_file;
		}

		if (links.empty()) {
			spdlog::info("No links to download. Add them to {}",
						 settings.input_file.string());
			return 0;
		}
		spdlog::info("Loaded {} links", links.size());

		auto http = std::make_shared<ffdl::net::HttpClient>(
			ffdl::net::browser_headers(settings.referer, settings.user_agent));
		auto observer = std::make_shared<CliObserver>(link_file);
		ffdl::SessionRunner runner(http, observer, settings.session);

		// Signals: stop on SIGINT/SIGTERM, pause/resume on SIGUSR1/SIGUSR2
		asio::io_context ioc;
		asio::signal_set signals(ioc, SIGINT, SIGTERM);
#ifdef SIGUSR1
		signals.add(SIGUSR1);
		signals.add(SIGUSR2);
#endif
		std::function<void(const boost::system::error_code &, int)> on_signal;
		on_signal = [&](const boost::system::error_code &ec, int sig) {
			if (ec) return;
#ifdef SIGUSR1
			if (sig == SIGUSR1) {
				runner.pause();
				signals.async_wait(on_signal);
				return;
			}
			if (sig == SIGUSR2) {
				runner.resume();
				signals.async_wait(on_signal);
				return;
			}
#endif
			fmt::println(stderr, "\nStopping, received signal {}.", sig);
			runner.stop();
		};
		signals.async_wait(on_signal);
		std::thread signal_thread([&ioc] { ioc.run(); });

		auto outcome = runner.run(links);

		signals.cancel();
		ioc.stop();
		signal_thread.join();

		if (settings.summary_json) {
			std::ofstream out(*settings.summary_json);
			if (!out) {
				spdlog::error("Cannot write {}",
							  settings.summary_json->string());
			} else {
				nlohmann::json j = outcome;
				out << j.dump(2) << "\n";
			}
		}

		const bool all_done =
			outcome.failed.empty() && outcome.completed.size() == links.size();
		return all_done ? 0 : 1;

	} catch (const std::exception &e) {
		fmt::println(stderr, "ERROR: {}", e.what());
		return 1;
	}
}
