#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

// Minimal tag scanner for download landing pages. It does not build a DOM;
// it only finds start tags and their attributes, which is all link
// resolution needs.
namespace ffdl::html {

// Names are lower-cased, values entity-decoded. Bare attributes map to "".
using Attributes = std::map<std::string, std::string>;

struct Element {
	Attributes attributes;
	std::string inner;	// Raw markup between the start and end tag
};

// Start tags of `tag` (void elements such as <meta>)
std::vector<Attributes> find_tags(std::string_view html, std::string_view tag);

// Elements of `tag` that have a matching end tag
std::vector<Element> find_elements(std::string_view html, std::string_view tag);

Attributes parse_attributes(std::string_view raw);

// &amp; &lt; &gt; &quot; &apos; &nbsp; and numeric references
std::string decode_entities(std::string_view text);

// Inner markup with tags removed, entities decoded, whitespace collapsed
std::string inner_text(std::string_view markup);

}  // namespace ffdl::html
