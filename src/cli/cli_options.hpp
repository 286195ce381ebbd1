#pragma once

#include <boost/program_options/options_description.hpp>
#include <ffdl/session.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ffdl::cli {

struct Settings {
	std::vector<std::string> urls;	// Replace the link file when present
	std::filesystem::path input_file = "input.txt";
	std::optional<std::filesystem::path> config_file;
	std::optional<std::filesystem::path> summary_json;
	std::string referer;
	std::string user_agent;
	bool update_input = false;
	bool verbose = false;
	bool quiet = false;
	bool show_help = false;

	SessionOptions session;
};

// The config file accepts config_options(); the command line accepts
// visible_options() plus positional URLs
boost::program_options::options_description config_options();
boost::program_options::options_description visible_options();

/// Command line first, then the --config file for anything not given.
/// Throws boost::program_options::error on invalid input.
Settings parse_settings(int argc, const char *const argv[]);

}  // namespace ffdl::cli
