#include <spdlog/spdlog.h>

#include <algorithm>
#include <ffdl/link_list.hpp>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_set>

namespace ffdl {

namespace fs = std::filesystem;

std::vector<std::string> parse_links(std::string_view text) {
	constexpr std::string_view kBom = "\xEF\xBB\xBF";
	if (text.substr(0, kBom.size()) == kBom) text.remove_prefix(kBom.size());

	std::vector<std::string> links;
	std::unordered_set<std::string> seen;

	while (!text.empty()) {
		auto nl = text.find('\n');
		auto line = text.substr(0, nl);
		text.remove_prefix(nl == std::string_view::npos ? text.size() : nl + 1);

		auto first = line.find_first_not_of(" \t\r");
		if (first == std::string_view::npos) continue;
		auto last = line.find_last_not_of(" \t\r");
		line = line.substr(first, last - first + 1);

		if (line.front() == '#') continue;
		std::string link(line);
		if (seen.insert(link).second) links.push_back(std::move(link));
	}
	return links;
}

Result<std::vector<std::string>> load_links(const fs::path &path) {
	std::error_code ec;
	if (!fs::exists(path, ec)) {
		spdlog::debug("{} not found, creating it", path.string());
		if (auto saved = save_links(path, {}); !saved) return saved.error();
		return std::vector<std::string>{};
	}

	std::ifstream in(path, std::ios::binary);
	if (!in) return make_error_code(errc::file_open_failed);
	std::ostringstream buffer;
	buffer << in.rdbuf();
	return parse_links(buffer.str());
}

Result<void> save_links(const fs::path &path,
						const std::vector<std::string> &links) {
	if (path.has_parent_path()) {
		std::error_code ec;
		fs::create_directories(path.parent_path(), ec);
	}
	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	if (!out) return make_error_code(errc::file_open_failed);

	out << kLinkFileHeader << '\n';
	for (const auto &link : links) out << link << '\n';
	out.flush();
	if (!out) return make_error_code(errc::file_write_failed);
	return outcome::success();
}

Result<void> remove_link(const fs::path &path, std::string_view link) {
	auto links = load_links(path);
	if (!links) return links.error();
	auto &list = links.value();
	list.erase(std::remove(list.begin(), list.end(), link), list.end());
	return save_links(path, list);
}

}  // namespace ffdl
