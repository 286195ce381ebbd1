#pragma once

#include <ffdl/ffdl_export.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "result.hpp"
#include "types.hpp"

namespace ffdl::net {
class HttpClient;
}

namespace ffdl {

/// Turns a download landing page into a filename and a directly fetchable
/// file URL.
class FFDL_EXPORT LinkResolver {
   public:
	static constexpr auto kPageTimeout = std::chrono::seconds(30);
	static constexpr std::string_view kFallbackFilename = "downloaded_file";
	static constexpr std::size_t kMaxFilenameBytes = 200;

	explicit LinkResolver(std::shared_ptr<net::HttpClient> http,
						  std::chrono::seconds timeout = kPageTimeout);

	/// Fails with the page fetch error, errc::http_error for a non-2xx
	/// page, or errc::no_download_url.
	Result<ResolvedTarget> resolve(std::string_view page_url) const;

	/// meta title/og:title, then <title>, then the URL basename, then
	/// kFallbackFilename. Always returns a safe name.
	static std::string extract_filename(std::string_view html,
										std::string_view page_url);

	/// window.open() inside a download script, then the longest
	/// download-looking anchor, then the page URL itself when it names an
	/// archive.
	static std::optional<std::string> extract_download_url(
		std::string_view html, std::string_view page_url);

	/// Strips path separators, reserved characters and control characters
	/// and trims whitespace. Returns "" when nothing usable remains
	/// (including "." and "..").
	static std::string sanitize_filename(std::string_view name);

	/// True when the URL path ends in a known archive/installer extension
	static bool has_download_extension(std::string_view url);

   private:
	std::shared_ptr<net::HttpClient> http_;
	std::chrono::seconds timeout_;
};

}  // namespace ffdl
