#pragma once

#include <ffdl/ffdl_export.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "result.hpp"

namespace ffdl::net {

using Headers = std::map<std::string, std::string>;

struct FFDL_EXPORT HttpResponse {
	int status_code = 0;
	std::string body;
	Headers headers;		// Keys are lower-cased
	std::string final_url;	// After redirects

	[[nodiscard]] bool ok() const {
		return status_code >= 200 && status_code < 300;
	}
	[[nodiscard]] std::optional<std::string> header(
		std::string_view name) const;
};

struct FFDL_EXPORT RequestOptions {
	std::chrono::seconds timeout{30};
	std::size_t read_block = 256 * 1024;
	int max_redirects = 10;
	bool accept_compressed = false;
};

// Called once with status and headers of the final (non-redirect) response.
// Returning false aborts the request with errc::aborted.
using HeaderSink = std::function<bool(const HttpResponse &head)>;
// Called for every body block. Returning false aborts with errc::aborted.
using BodySink = std::function<bool(const char *data, std::size_t size)>;

/// Static header set mimicking a desktop Chromium-based browser.
FFDL_EXPORT Headers browser_headers(std::string_view referer = {},
									std::string_view user_agent = {});

/// Blocking HTTP/1.1 client for http and https URLs. Every call runs on a
/// private io_context driven by the calling thread, so one instance may be
/// shared by any number of threads.
class FFDL_EXPORT HttpClient {
   public:
	HttpClient(const HttpClient &) = delete;
	HttpClient &operator=(const HttpClient &) = delete;
	HttpClient(HttpClient &&) noexcept;
	HttpClient &operator=(HttpClient &&) noexcept;
	~HttpClient();

	explicit HttpClient(Headers default_headers = browser_headers());

	[[nodiscard]] const Headers &default_headers() const;

	Result<HttpResponse> head(
		std::string_view url, const Headers &headers = {},
		std::chrono::seconds timeout = std::chrono::seconds(10));

	// Buffered GET; gzip/deflate bodies are decompressed
	Result<HttpResponse> get(
		std::string_view url, const Headers &headers = {},
		std::chrono::seconds timeout = std::chrono::seconds(30));

	// Streaming GET; the returned response carries no body
	Result<HttpResponse> stream(std::string_view url, const Headers &headers,
								const RequestOptions &options,
								HeaderSink on_header, BodySink on_body);

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

}  // namespace ffdl::net
