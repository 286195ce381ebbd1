#include "cli_options.hpp"

#include <spdlog/spdlog.h>

#include <boost/program_options.hpp>
#include <fstream>

namespace ffdl::cli {

namespace po = boost::program_options;

namespace {

constexpr std::size_t kMaxWorkers = 32;

void check_settings(Settings &s, const po::variables_map &vm) {
	auto workers = vm["workers"].as<std::size_t>();
	if (workers == 0 || workers > kMaxWorkers) {
		throw po::validation_error(po::validation_error::invalid_option_value,
								   "workers", std::to_string(workers));
	}
	auto chunk_mib = vm["chunk-size-mib"].as<std::uint64_t>();
	if (chunk_mib == 0) {
		throw po::validation_error(po::validation_error::invalid_option_value,
								   "chunk-size-mib", "0");
	}
	s.session.transfer.max_workers = workers;
	s.session.transfer.chunk_size = chunk_mib * kMiB;
}

}  // namespace

po::options_description config_options() {
	po::options_description desc("Download options");
	// clang-format off
	desc.add_options()
		("input,i", po::value<std::string>()->default_value("input.txt"),
		 "Link file, one URL per line")
		("output-dir,o", po::value<std::string>()->default_value("downloads"),
		 "Directory downloads are written to")
		("workers", po::value<std::size_t>()->default_value(6),
		 "Parallel chunk downloads per file")
		("chunk-size-mib", po::value<std::uint64_t>()->default_value(4),
		 "Chunk size in MiB")
		("referer", po::value<std::string>(),
		 "Referer header sent with every request")
		("user-agent", po::value<std::string>(),
		 "User-Agent header sent with every request")
		("keep-partial", po::bool_switch(),
		 "Keep a file whose chunks failed instead of failing the link")
		("update-input", po::bool_switch(),
		 "Remove completed links from the link file")
		("summary-json", po::value<std::string>(),
		 "Write completed/failed links as JSON to this file");
	// clang-format on
	return desc;
}

po::options_description visible_options() {
	po::options_description generic("Options");
	// clang-format off
	generic.add_options()
		("help,h", "Print help message")
		("config,c", po::value<std::string>(), "INI file with download options")
		("verbose,v", "Enable verbose logging")
		("quiet,q", "Only log warnings and errors");
	// clang-format on
	generic.add(config_options());
	return generic;
}

Settings parse_settings(int argc, const char *const argv[]) {
	po::options_description hidden;
	hidden.add_options()("url", po::value<std::vector<std::string>>(),
						 "Links to download");
	po::options_description all;
	all.add(visible_options()).add(hidden);

	po::positional_options_description positional;
	positional.add("url", -1);

	po::variables_map vm;
	po::store(po::command_line_parser(argc, argv)
				  .options(all)
				  .positional(positional)
				  .run(),
			  vm);

	Settings s;
	if (vm.count("config")) {
		s.config_file = vm["config"].as<std::string>();
		std::ifstream in(*s.config_file);
		if (!in) {
			throw po::error("cannot open config file " +
							s.config_file->string());
		}
		spdlog::debug("Reading settings from {}", s.config_file->string());
		po::store(po::parse_config_file(in, config_options()), vm);
	}
	po::notify(vm);

	s.show_help = vm.count("help") > 0;
	s.verbose = vm.count("verbose") > 0;
	s.quiet = vm.count("quiet") > 0;
	if (vm.count("url")) s.urls = vm["url"].as<std::vector<std::string>>();

	s.input_file = vm["input"].as<std::string>();
	s.session.download_dir = vm["output-dir"].as<std::string>();
	if (vm.count("referer")) s.referer = vm["referer"].as<std::string>();
	if (vm.count("user-agent")) {
		s.user_agent = vm["user-agent"].as<std::string>();
	}
	if (vm.count("summary-json")) {
		s.summary_json = vm["summary-json"].as<std::string>();
	}
	s.update_input = vm["update-input"].as<bool>();
	s.session.transfer.fail_on_incomplete = !vm["keep-partial"].as<bool>();

	check_settings(s, vm);
	return s;
}

}  // namespace ffdl::cli
