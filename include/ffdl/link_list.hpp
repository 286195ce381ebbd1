#pragma once

#include <ffdl/ffdl_export.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "result.hpp"

namespace ffdl {

inline constexpr std::string_view kLinkFileHeader =
	"# Add download links here (lines starting with # are comments)";

// One link per line. Blank lines and '#' comments are skipped, surrounding
// whitespace is trimmed and repeated links keep their first position.
FFDL_EXPORT std::vector<std::string> parse_links(std::string_view text);

// A missing file is created holding only the comment header
FFDL_EXPORT Result<std::vector<std::string>> load_links(
	const std::filesystem::path &path);

FFDL_EXPORT Result<void> save_links(const std::filesystem::path &path,
									const std::vector<std::string> &links);

// Rewrites the file without `link`
FFDL_EXPORT Result<void> remove_link(const std::filesystem::path &path,
									 std::string_view link);

}  // namespace ffdl
