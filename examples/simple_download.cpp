#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <ffdl/http_client.hpp>
#include <ffdl/link_resolver.hpp>
#include <ffdl/observer.hpp>
#include <ffdl/transfer.hpp>
#include <filesystem>
#include <iomanip>
#include <iostream>

using namespace ffdl;

// Prints progress at most every half second
class ConsoleObserver : public SessionObserver {
   public:
	void on_log(const std::string &message) override {
		spdlog::info("{}", message);
	}

	void on_progress(std::uint64_t downloaded, std::uint64_t total) override {
		auto now = std::chrono::steady_clock::now();
		if (now - last_print_ < std::chrono::milliseconds(500) &&
			downloaded != total) {
			return;
		}
		last_print_ = now;
		double pct = total > 0 ? 100.0 * static_cast<double>(downloaded) /
									 static_cast<double>(total)
							   : 0.0;
		std::cout << "\r" << std::fixed << std::setprecision(1) << pct << "% ("
				  << downloaded / 1024 / 1024 << "MB / "
				  << total / 1024 / 1024 << "MB)   " << std::flush;
	}

   private:
	std::chrono::steady_clock::time_point last_print_{};
};

int main(int argc, char *argv[]) {
	// Initialize logger
	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	auto logger = std::make_shared<spdlog::logger>("ffdl", console_sink);
	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::debug);

	if (argc < 2) {
		std::cerr << "Usage: simple_download <page-url> [output-dir]\n";
		return 1;
	}
	const std::string url = argv[1];
	const std::filesystem::path dir = argc > 2 ? argv[2] : ".";

	// Components
	auto http = std::make_shared<net::HttpClient>();
	auto observer = std::make_shared<ConsoleObserver>();
	LinkResolver resolver(http);

	std::cout << "Resolving " << url << "...\n";
	auto target = resolver.resolve(url);
	if (!target) {
		std::cerr << "Resolution failed: " << target.error().message() << "\n";
		return 1;
	}
	std::cout << "File: " << target.value().filename << "\n"
			  << "From: " << target.value().direct_url << "\n";

	TransferCoordinator transfer(http, nullptr, observer);
	auto report = transfer.run(target.value().direct_url,
							   dir / target.value().filename);
	if (!report) {
		spdlog::error("Download failed: {}", report.error().message());
		return 1;
	}

	std::cout << "\nOperation complete.\n"
			  << "Downloaded " << report.value().bytes_written << " bytes to "
			  << (dir / target.value().filename).string() << "\n";
	return 0;
}
