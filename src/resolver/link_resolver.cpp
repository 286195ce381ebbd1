#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/regex.hpp>
#include <boost/url.hpp>
#include <ffdl/http_client.hpp>
#include <ffdl/link_resolver.hpp>

#include "html_scan.hpp"

namespace ffdl {

namespace {

constexpr std::array<std::string_view, 9> kDownloadExtensions = {
	".zip", ".rar", ".exe", ".iso", ".tar.gz",
	".torrent", ".dmg", ".7z", ".gz"};

constexpr std::string_view kReservedChars = "\\/*?:\"<>|";

bool is_absolute_http(std::string_view href) {
	return boost::algorithm::istarts_with(href, "http://") ||
		   boost::algorithm::istarts_with(href, "https://");
}

// Drop "?query" and "#fragment"
std::string_view strip_query(std::string_view url) {
	auto cut = url.find_first_of("?#");
	return cut == std::string_view::npos ? url : url.substr(0, cut);
}

std::string url_basename(std::string_view url) {
	auto parsed = boost::urls::parse_uri_reference(url);
	if (parsed) {
		auto segs = parsed->segments();
		if (segs.empty()) return {};
		return segs.back();
	}
	// Not a valid URI; split it by hand
	auto path = strip_query(url);
	auto slash = path.rfind('/');
	return std::string(slash == std::string_view::npos ? path
													   : path.substr(slash + 1));
}

std::string trim_ws(std::string_view s) {
	auto is_ws = [](char c) {
		return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
			   c == '\v';
	};
	while (!s.empty() && is_ws(s.front())) s.remove_prefix(1);
	while (!s.empty() && is_ws(s.back())) s.remove_suffix(1);
	return std::string(s);
}

std::optional<std::string> url_from_scripts(std::string_view html) {
	static const boost::regex re(
		R"re(window\.open\(["'](https?://[^\s"'\)]+))re");

	for (const auto &script : html::find_elements(html, "script")) {
		if (script.inner.find("function download") == std::string::npos) {
			continue;
		}
		boost::smatch m;
		if (boost::regex_search(script.inner, m, re)) return m[1].str();
	}
	return std::nullopt;
}

std::optional<std::string> url_from_anchors(std::string_view html) {
	std::optional<std::string> best;
	for (const auto &anchor : html::find_elements(html, "a")) {
		auto href_it = anchor.attributes.find("href");
		if (href_it == anchor.attributes.end()) continue;
		const std::string href = trim_ws(href_it->second);
		if (!is_absolute_http(href)) continue;

		const auto text =
			boost::algorithm::to_lower_copy(html::inner_text(anchor.inner));
		const bool affordance =
			anchor.attributes.count("download") > 0 ||
			text.find("download") != std::string::npos ||
			text.find("get file") != std::string::npos ||
			boost::algorithm::icontains(href, "download");

		if (!affordance && !LinkResolver::has_download_extension(href)) {
			continue;
		}
		// Longest wins; on a tie the first one seen stays
		if (!best || href.size() > best->size()) best = href;
	}
	return best;
}

}  // namespace

LinkResolver::LinkResolver(std::shared_ptr<net::HttpClient> http,
						   std::chrono::seconds timeout)
	: http_(std::move(http)), timeout_(timeout) {}

Result<ResolvedTarget> LinkResolver::resolve(std::string_view page_url) const {
	auto page = http_->get(page_url, {}, timeout_);
	if (!page) {
		spdlog::debug("Fetching {} failed: {}", page_url,
					  page.error().message());
		return page.error();
	}
	const auto &response = page.value();
	if (!response.ok()) {
		spdlog::debug("Page {} answered with HTTP {}", page_url,
					  response.status_code);
		return make_error_code(errc::http_error);
	}

	ResolvedTarget target;
	target.filename = extract_filename(response.body, page_url);
	if (target.filename.empty()) return make_error_code(errc::no_filename);

	auto direct = extract_download_url(response.body, page_url);
	if (!direct) return make_error_code(errc::no_download_url);
	target.direct_url = std::move(*direct);

	spdlog::debug("Resolved {} -> {} ({})", page_url, target.direct_url,
				  target.filename);
	return target;
}

std::string LinkResolver::extract_filename(std::string_view html,
										   std::string_view page_url) {
	for (const auto &meta : html::find_tags(html, "meta")) {
		auto content = meta.find("content");
		if (content == meta.end()) continue;

		bool is_title = false;
		for (const char *key : {"name", "property"}) {
			auto it = meta.find(key);
			if (it == meta.end()) continue;
			auto v = boost::algorithm::to_lower_copy(trim_ws(it->second));
			if (v == "title" || v == "og:title") is_title = true;
		}
		if (!is_title) continue;

		if (auto name = sanitize_filename(content->second); !name.empty()) {
			return name;
		}
	}

	for (const auto &title : html::find_elements(html, "title")) {
		if (auto name = sanitize_filename(html::inner_text(title.inner));
			!name.empty()) {
			return name;
		}
		break;
	}

	if (auto name = sanitize_filename(url_basename(page_url)); !name.empty()) {
		return name;
	}
	return std::string(kFallbackFilename);
}

std::optional<std::string> LinkResolver::extract_download_url(
	std::string_view html, std::string_view page_url) {
	if (auto url = url_from_scripts(html)) return url;
	if (auto url = url_from_anchors(html)) return url;
	if (has_download_extension(page_url)) return std::string(page_url);
	return std::nullopt;
}

std::string LinkResolver::sanitize_filename(std::string_view name) {
	std::string out;
	out.reserve(name.size());
	for (char c : name) {
		auto uc = static_cast<unsigned char>(c);
		if (uc < 0x20 || uc == 0x7F) continue;
		if (kReservedChars.find(c) != std::string_view::npos) continue;
		out += c;
	}
	out = trim_ws(out);

	if (out.size() > kMaxFilenameBytes) {
		std::size_t cut = kMaxFilenameBytes;
		// Back up to the first byte of a UTF-8 sequence
		while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) {
			--cut;
		}
		out = trim_ws(std::string_view(out).substr(0, cut));
	}

	if (out.find_first_not_of('.') == std::string::npos) return {};
	return out;
}

bool LinkResolver::has_download_extension(std::string_view url) {
	auto path = strip_query(url);
	for (auto ext : kDownloadExtensions) {
		if (boost::algorithm::iends_with(path, ext)) return true;
	}
	return false;
}

}  // namespace ffdl
