#include "html_scan.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/regex.hpp>
#include <cstdint>

#include "utils.hpp"

namespace ffdl::html {

namespace {

void append_utf8(std::string &out, std::uint32_t cp) {
	if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
		cp = 0xFFFD;
	}
	if (cp < 0x80) {
		out += static_cast<char>(cp);
	} else if (cp < 0x800) {
		out += static_cast<char>(0xC0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else if (cp < 0x10000) {
		out += static_cast<char>(0xE0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else {
		out += static_cast<char>(0xF0 | (cp >> 18));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
}

bool decode_numeric(std::string_view ref, std::string &out) {
	// ref is the text between "&#" and ";"
	std::uint32_t cp = 0;
	if (!ref.empty() && (ref.front() == 'x' || ref.front() == 'X')) {
		ref.remove_prefix(1);
		if (ref.empty() || ref.size() > 6) return false;
		for (char c : ref) {
			cp <<= 4;
			if (c >= '0' && c <= '9') {
				cp |= static_cast<std::uint32_t>(c - '0');
			} else if (c >= 'a' && c <= 'f') {
				cp |= static_cast<std::uint32_t>(c - 'a' + 10);
			} else if (c >= 'A' && c <= 'F') {
				cp |= static_cast<std::uint32_t>(c - 'A' + 10);
			} else {
				return false;
			}
		}
	} else {
		auto n = utils::to_number<std::uint32_t>(ref);
		if (!n) return false;
		cp = n.value();
	}
	append_utf8(out, cp);
	return true;
}

std::string_view named_entity(std::string_view name) {
	if (name == "amp") return "&";
	if (name == "lt") return "<";
	if (name == "gt") return ">";
	if (name == "quot") return "\"";
	if (name == "apos") return "'";
	if (name == "nbsp") return " ";
	return {};
}

}  // namespace

std::string decode_entities(std::string_view text) {
	std::string out;
	out.reserve(text.size());

	std::size_t i = 0;
	while (i < text.size()) {
		if (text[i] != '&') {
			out += text[i++];
			continue;
		}
		auto semi = text.find(';', i + 1);
		// Longest entity we understand is "&#x10FFFF;"
		if (semi == std::string_view::npos || semi - i > 10) {
			out += text[i++];
			continue;
		}
		auto ref = text.substr(i + 1, semi - i - 1);
		bool done = false;
		if (!ref.empty() && ref.front() == '#') {
			done = decode_numeric(ref.substr(1), out);
		} else if (auto rep = named_entity(ref); !rep.empty()) {
			out += rep;
			done = true;
		}
		if (done) {
			i = semi + 1;
		} else {
			out += text[i++];
		}
	}
	return out;
}

Attributes parse_attributes(std::string_view raw) {
	static const boost::regex re(
		R"re(([A-Za-z_:][-A-Za-z0-9_:.]*)(?:\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s"'=<>`]+)))?)re");

	Attributes attrs;
	boost::cregex_iterator it(raw.data(), raw.data() + raw.size(), re);
	for (boost::cregex_iterator end; it != end; ++it) {
		const auto &m = *it;
		auto name = boost::algorithm::to_lower_copy(m[1].str());
		std::string value;
		for (int g = 2; g <= 4; ++g) {
			if (m[g].matched) {
				value = decode_entities(m[g].str());
				break;
			}
		}
		// First occurrence wins, as in browsers
		attrs.emplace(std::move(name), std::move(value));
	}
	return attrs;
}

// Attribute run of a start tag; '>' inside a quoted value does not end it.
// A stray unbalanced quote is taken as a plain character.
constexpr std::string_view kAttributeRun =
	R"((?:[^>"']|"[^"]*"|'[^']*'|["'])*)";

std::vector<Attributes> find_tags(std::string_view html, std::string_view tag) {
	std::vector<Attributes> out;
	try {
		const boost::regex re(fmt::format(R"(<{}\b({})>)", tag, kAttributeRun),
							  boost::regex::perl | boost::regex::icase);
		boost::cregex_iterator it(html.data(), html.data() + html.size(), re);
		for (boost::cregex_iterator end; it != end; ++it) {
			const auto &m = *it;
			out.push_back(parse_attributes(
				std::string_view(m[1].first, static_cast<std::size_t>(m[1].length()))));
		}
	} catch (const std::exception &e) {
		spdlog::debug("Scanning <{}> tags failed: {}", tag, e.what());
	}
	return out;
}

std::vector<Element> find_elements(std::string_view html,
								   std::string_view tag) {
	std::vector<Element> out;
	try {
		const boost::regex re(
			fmt::format(R"(<{0}\b({1})>([\s\S]*?)</{0}\s*>)", tag,
						kAttributeRun),
			boost::regex::perl | boost::regex::icase);
		boost::cregex_iterator it(html.data(), html.data() + html.size(), re);
		for (boost::cregex_iterator end; it != end; ++it) {
			const auto &m = *it;
			Element el;
			el.attributes = parse_attributes(
				std::string_view(m[1].first, static_cast<std::size_t>(m[1].length())));
			el.inner = m[2].str();
			out.push_back(std::move(el));
		}
	} catch (const std::exception &e) {
		spdlog::debug("Scanning <{}> elements failed: {}", tag, e.what());
	}
	return out;
}

std::string inner_text(std::string_view markup) {
	static const boost::regex tags(fmt::format("<{}>", kAttributeRun));
	std::string stripped = boost::regex_replace(
		std::string(markup), tags, " ", boost::format_all);
	std::string decoded = decode_entities(stripped);

	std::string out;
	out.reserve(decoded.size());
	bool space = false;
	for (char c : decoded) {
		if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f') {
			space = true;
			continue;
		}
		if (space && !out.empty()) out += ' ';
		space = false;
		out += c;
	}
	return out;
}

}  // namespace ffdl::html
