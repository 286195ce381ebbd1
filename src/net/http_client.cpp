#include <spdlog/spdlog.h>
#include <zlib.h>

#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/certify/extensions.hpp>
#include <boost/certify/https_verification.hpp>
#include <boost/url.hpp>
#include <chrono>
#include <ffdl/http_client.hpp>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace ffdl::net {

namespace {

constexpr std::size_t kMaxBufferedBody = 64 * 1024 * 1024;
constexpr std::size_t kPageReadBlock = 64 * 1024;

constexpr std::string_view kDefaultReferer = "https://fitgirl-repacks.site/";
constexpr std::string_view kDefaultUserAgent =
	"Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, "
	"like Gecko) Chrome/131.0.0.0 Safari/537.36";

// =============================================================================
// Content-Encoding
// =============================================================================

// window_bits: 16+MAX_WBITS gzip, 32+MAX_WBITS auto-detect, -MAX_WBITS raw
std::optional<std::string> inflate_body(const std::string &compressed,
										int window_bits) {
	if (compressed.empty()) return std::string{};

	z_stream zs{};
	if (inflateInit2(&zs, window_bits) != Z_OK) {
		spdlog::warn("Failed to init zlib (window bits {})", window_bits);
		return std::nullopt;
	}

	zs.next_in =
		reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
	zs.avail_in = static_cast<uInt>(compressed.size());

	std::string out;
	out.reserve(compressed.size() * 4);

	constexpr size_t kOutChunk = 32768;
	char outbuffer[kOutChunk];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(outbuffer);
		zs.avail_out = kOutChunk;

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
			(ret == Z_BUF_ERROR && zs.avail_in == 0)) {
			inflateEnd(&zs);
			spdlog::debug("zlib inflate error: {}", ret);
			return std::nullopt;
		}

		out.append(outbuffer, kOutChunk - zs.avail_out);
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return out;
}

std::string decompress_body(std::string body, const std::string &encoding) {
	if (encoding.empty() || encoding == "identity") return body;

	if (encoding == "gzip" || encoding == "x-gzip") {
		if (auto result = inflate_body(body, 16 + MAX_WBITS)) {
			spdlog::debug(
				"Decompressed gzip: {} -> {} bytes", body.size(), result->size());
			return std::move(*result);
		}
	} else if (encoding == "deflate") {
		// Some servers send zlib-wrapped data, some raw deflate
		if (auto result = inflate_body(body, 32 + MAX_WBITS)) {
			return std::move(*result);
		}
		if (auto result = inflate_body(body, -MAX_WBITS)) {
			return std::move(*result);
		}
	} else {
		spdlog::debug("Unknown Content-Encoding: {}, returning raw body",
					  encoding);
		return body;
	}

	spdlog::warn("{} decompression failed, returning raw body", encoding);
	return body;
}

// =============================================================================
// DNS CACHE
// =============================================================================
// Shared by every request of the process. Chunk workers hit the same host
// several times per file, so this saves one lookup per range request.
// =============================================================================

class DnsCache {
   public:
	static constexpr auto kTTL = std::chrono::minutes(5);
	static constexpr size_t kMaxEntries = 64;

	std::optional<tcp::resolver::results_type> get(const std::string &host,
												   const std::string &port) {
		std::lock_guard lock(mutex_);
		auto it = cache_.find(host + ":" + port);
		if (it == cache_.end()) return std::nullopt;
		if (std::chrono::steady_clock::now() > it->second.expires_at) {
			cache_.erase(it);
			return std::nullopt;
		}
		return it->second.results;
	}

	void put(const std::string &host, const std::string &port,
			 const tcp::resolver::results_type &results) {
		std::lock_guard lock(mutex_);
		auto now = std::chrono::steady_clock::now();
		if (cache_.size() >= kMaxEntries) {
			for (auto it = cache_.begin(); it != cache_.end();) {
				it = now > it->second.expires_at ? cache_.erase(it)
												 : std::next(it);
			}
		}
		if (cache_.size() >= kMaxEntries) cache_.erase(cache_.begin());
		cache_[host + ":" + port] = Entry{results, now + kTTL};
	}

	void invalidate(const std::string &host, const std::string &port) {
		std::lock_guard lock(mutex_);
		cache_.erase(host + ":" + port);
	}

   private:
	struct Entry {
		tcp::resolver::results_type results;
		std::chrono::steady_clock::time_point expires_at;
	};

	std::mutex mutex_;
	std::unordered_map<std::string, Entry> cache_;
};

DnsCache &dns_cache() {
	static DnsCache instance;
	return instance;
}

// =============================================================================
// URL -> connection endpoint
// =============================================================================

struct Endpoint {
	bool tls = false;
	std::string host;
	std::string port;
	std::string target;

	[[nodiscard]] std::string host_header() const {
		bool default_port =
			(tls && port == "443") || (!tls && port == "80");
		return default_port ? host : host + ":" + port;
	}
};

Result<Endpoint> parse_endpoint(std::string_view url) {
	auto u_res = boost::urls::parse_uri(url);
	if (u_res.has_error()) return outcome::failure(errc::invalid_url);
	boost::urls::url_view u = u_res.value();

	Endpoint ep;
	if (u.scheme_id() == boost::urls::scheme::https) {
		ep.tls = true;
	} else if (u.scheme_id() != boost::urls::scheme::http) {
		return outcome::failure(errc::invalid_url);
	}

	ep.host = std::string(u.host_address());
	if (ep.host.empty()) return outcome::failure(errc::invalid_url);
	ep.port = std::string(u.port());
	if (ep.port.empty()) ep.port = ep.tls ? "443" : "80";

	ep.target = std::string(u.encoded_path());
	if (u.has_query()) {
		ep.target += "?";
		ep.target += std::string(u.encoded_query());
	}
	if (ep.target.empty()) ep.target = "/";
	return ep;
}

bool is_redirect(int status) {
	return status == 301 || status == 302 || status == 303 || status == 307 ||
		   status == 308;
}

std::error_code map_error(const beast::error_code &ec) {
	if (ec == beast::error::timeout) return make_error_code(errc::timeout);
	return make_error_code(errc::request_failed);
}

// =============================================================================
// One request/response exchange over a fresh connection
// =============================================================================

class Exchange : public std::enable_shared_from_this<Exchange> {
   public:
	Exchange(asio::io_context &ioc, ssl::context &ctx, Endpoint endpoint,
			 const RequestOptions &options, HeaderSink on_header,
			 BodySink on_body)
		: resolver_(ioc),
		  endpoint_(std::move(endpoint)),
		  timeout_(options.timeout),
		  accept_compressed_(options.accept_compressed),
		  on_header_(std::move(on_header)),
		  on_body_(std::move(on_body)),
		  buf_(std::max<std::size_t>(options.read_block, 4096)) {
		if (endpoint_.tls) {
			tls_.emplace(ioc, ctx);
		} else {
			plain_.emplace(ioc);
		}
	}

	void run(http::verb method, const Headers &headers) {
		req_.version(11);
		req_.method(method);
		req_.target(endpoint_.target);
		for (const auto &[key, value] : headers) { req_.set(key, value); }
		req_.set(http::field::host, endpoint_.host_header());
		req_.set(http::field::connection, "close");
		if (accept_compressed_) {
			req_.set(http::field::accept_encoding, "gzip, deflate");
		}

		parser_.emplace();
		parser_->body_limit(boost::none);
		if (method == http::verb::head) parser_->skip(true);

		if (tls_) {
			boost::certify::set_server_hostname(*tls_, endpoint_.host);
		}

		auto cached = dns_cache().get(endpoint_.host, endpoint_.port);
		if (cached) {
			on_resolve({}, *cached);
		} else {
			resolver_.async_resolve(
				endpoint_.host, endpoint_.port,
				beast::bind_front_handler(
					&Exchange::on_resolve, shared_from_this()));
		}
	}

	Result<HttpResponse> take_result() { return std::move(result_); }
	[[nodiscard]] const std::optional<std::string> &redirect_location() const {
		return location_;
	}

   private:
	tcp::resolver resolver_;
	std::optional<beast::tcp_stream> plain_;
	std::optional<beast::ssl_stream<beast::tcp_stream>> tls_;
	Endpoint endpoint_;
	std::chrono::seconds timeout_;
	bool accept_compressed_;
	HeaderSink on_header_;
	BodySink on_body_;

	http::request<http::empty_body> req_;
	std::optional<http::response_parser<http::buffer_body>> parser_;
	beast::flat_buffer buffer_;
	std::vector<char> buf_;

	HttpResponse head_;
	Result<HttpResponse> result_{make_error_code(errc::request_failed)};
	std::optional<std::string> location_;

	beast::tcp_stream &lowest() {
		return tls_ ? beast::get_lowest_layer(*tls_) : *plain_;
	}

	template <typename F>
	void with_stream(F &&f) {
		if (tls_) {
			f(*tls_);
		} else {
			f(*plain_);
		}
	}

	void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
		if (ec) return fail(ec, "resolve");

		dns_cache().put(endpoint_.host, endpoint_.port, results);

		lowest().expires_after(timeout_);
		lowest().async_connect(
			results,
			beast::bind_front_handler(&Exchange::on_connect, shared_from_this()));
	}

	void on_connect(beast::error_code ec, const tcp::endpoint & /*unused*/) {
		if (ec) {
			dns_cache().invalidate(endpoint_.host, endpoint_.port);
			return fail(ec, "connect");
		}

		if (tls_) {
			tls_->async_handshake(
				ssl::stream_base::client,
				beast::bind_front_handler(
					&Exchange::on_handshake, shared_from_this()));
		} else {
			do_write();
		}
	}

	void on_handshake(beast::error_code ec) {
		if (ec) return fail(ec, "handshake");
		do_write();
	}

	void do_write() {
		lowest().expires_after(timeout_);
		with_stream([this](auto &stream) {
			http::async_write(
				stream, req_,
				beast::bind_front_handler(
					&Exchange::on_write, shared_from_this()));
		});
	}

	void on_write(beast::error_code ec, std::size_t /*unused*/) {
		if (ec) return fail(ec, "write");

		lowest().expires_after(timeout_);
		with_stream([this](auto &stream) {
			http::async_read_header(
				stream, buffer_, *parser_,
				beast::bind_front_handler(
					&Exchange::on_read_header, shared_from_this()));
		});
	}

	void on_read_header(beast::error_code ec, std::size_t /*unused*/) {
		if (ec) return fail(ec, "read_header");

		const auto &res = parser_->get();
		head_.status_code = static_cast<int>(res.result_int());
		for (const auto &field : res) {
			head_.headers[boost::algorithm::to_lower_copy(
				std::string(field.name_string()))] = std::string(field.value());
		}

		if (is_redirect(head_.status_code)) {
			if (auto loc = head_.header("location"); loc && !loc->empty()) {
				location_ = std::move(*loc);
				return finish(std::move(head_));
			}
		}

		if (on_header_ && !on_header_(head_)) {
			return finish(outcome::failure(errc::aborted));
		}

		read_body();
	}

	void read_body() {
		if (parser_->is_done()) return finish(std::move(head_));

		lowest().expires_after(timeout_);
		parser_->get().body().data = buf_.data();
		parser_->get().body().size = buf_.size();

		with_stream([this](auto &stream) {
			http::async_read(stream, buffer_, *parser_,
							 beast::bind_front_handler(
								 &Exchange::on_read_body, shared_from_this()));
		});
	}

	void on_read_body(beast::error_code ec, std::size_t /*unused*/) {
		if (ec == http::error::need_buffer) ec = {};
		if (ec) return fail(ec, "read_body");

		size_t bytes_read = buf_.size() - parser_->get().body().size;
		if (bytes_read > 0 && on_body_ && !on_body_(buf_.data(), bytes_read)) {
			return finish(outcome::failure(errc::aborted));
		}

		read_body();
	}

	void fail(beast::error_code ec, const char *what) {
		spdlog::debug("HTTP {} {}{} failed in {}: {}",
					  std::string(http::to_string(req_.method())),
					  endpoint_.host, endpoint_.target, what, ec.message());
		finish(outcome::failure(map_error(ec)));
	}

	void finish(Result<HttpResponse> res) {
		result_ = std::move(res);
		beast::error_code ignored;
		lowest().socket().shutdown(tcp::socket::shutdown_both, ignored);
		lowest().close();
	}
};

}  // namespace

std::optional<std::string> HttpResponse::header(std::string_view name) const {
	auto it = headers.find(boost::algorithm::to_lower_copy(std::string(name)));
	if (it == headers.end()) return std::nullopt;
	return it->second;
}

Headers browser_headers(std::string_view referer, std::string_view user_agent) {
	return {
		{"Accept",
		 "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,"
		 "image/webp,image/apng,*/*;q=0.8"},
		{"Accept-Language", "en-US,en;q=0.5"},
		{"Referer", std::string(referer.empty() ? kDefaultReferer : referer)},
		{"sec-ch-ua",
		 "\"Brave\";v=\"131\", \"Chromium\";v=\"131\", \"Not_A "
		 "Brand\";v=\"24\""},
		{"sec-ch-ua-mobile", "?0"},
		{"sec-ch-ua-platform", "\"Windows\""},
		{"User-Agent",
		 std::string(user_agent.empty() ? kDefaultUserAgent : user_agent)},
	};
}

struct HttpClient::Impl {
	Headers default_headers;
	ssl::context ssl_ctx;

	explicit Impl(Headers headers)
		: default_headers(std::move(headers)),
		  ssl_ctx(ssl::context::tlsv12_client) {
		boost::system::error_code ec;
		ssl_ctx.set_verify_mode(
			ssl::verify_peer | ssl::verify_fail_if_no_peer_cert, ec);
		if (ec) {
			spdlog::error("Failed to set SSL verify mode: {}", ec.message());
		}

		ssl_ctx.set_default_verify_paths(ec);
		if (ec) {
			spdlog::error(
				"Failed to set default SSL verify paths: {}", ec.message());
		}

		boost::certify::enable_native_https_server_verification(ssl_ctx);
	}

	Result<HttpResponse> execute(http::verb method, std::string_view url,
								 const Headers &headers,
								 const RequestOptions &options,
								 const HeaderSink &on_header,
								 const BodySink &on_body) {
		Headers merged = default_headers;
		for (const auto &[key, value] : headers) { merged[key] = value; }

		std::string current(url);
		try {
			for (int hop = 0; hop <= options.max_redirects; ++hop) {
				auto endpoint = parse_endpoint(current);
				if (!endpoint) return endpoint.error();

				asio::io_context ioc;
				auto exchange = std::make_shared<Exchange>(
					ioc, ssl_ctx, std::move(endpoint).value(), options,
					on_header, on_body);
				exchange->run(method, merged);
				ioc.run();

				auto res = exchange->take_result();
				if (!res) return res.error();

				const auto &location = exchange->redirect_location();
				if (!location) {
					res.value().final_url = current;
					return res;
				}

				auto next = resolve_location(current, *location);
				if (!next) return next.error();
				spdlog::debug("Redirect {} -> {}", current, next.value());
				current = std::move(next).value();
			}
		} catch (const std::exception &e) {
			spdlog::error("Request exception for {}: {}", current, e.what());
			return outcome::failure(errc::request_failed);
		}

		spdlog::warn("Too many redirects for {}", url);
		return outcome::failure(errc::too_many_redirects);
	}

	static Result<std::string> resolve_location(const std::string &base,
												const std::string &location) {
		auto base_res = boost::urls::parse_uri(base);
		auto ref_res = boost::urls::parse_uri_reference(location);
		if (base_res.has_error() || ref_res.has_error()) {
			return outcome::failure(errc::invalid_url);
		}
		boost::urls::url dest;
		auto rv = boost::urls::resolve(base_res.value(), ref_res.value(), dest);
		if (rv.has_error()) return outcome::failure(errc::invalid_url);
		return std::string(dest.buffer());
	}
};

HttpClient::HttpClient(Headers default_headers)
	: m_impl(std::make_unique<Impl>(std::move(default_headers))) {}

HttpClient::~HttpClient() = default;
HttpClient::HttpClient(HttpClient &&) noexcept = default;
HttpClient &HttpClient::operator=(HttpClient &&) noexcept = default;

const Headers &HttpClient::default_headers() const {
	return m_impl->default_headers;
}

Result<HttpResponse> HttpClient::head(std::string_view url,
									  const Headers &headers,
									  std::chrono::seconds timeout) {
	RequestOptions options;
	options.timeout = timeout;
	return m_impl->execute(
		http::verb::head, url, headers, options, nullptr, nullptr);
}

Result<HttpResponse> HttpClient::get(std::string_view url,
									 const Headers &headers,
									 std::chrono::seconds timeout) {
	RequestOptions options;
	options.timeout = timeout;
	options.read_block = kPageReadBlock;
	options.accept_compressed = true;

	std::string body;
	auto res = m_impl->execute(
		http::verb::get, url, headers, options, nullptr,
		[&body](const char *data, std::size_t size) {
			if (body.size() + size > kMaxBufferedBody) {
				spdlog::warn("Response body exceeds {} bytes", kMaxBufferedBody);
				return false;
			}
			body.append(data, size);
			return true;
		});
	if (!res) return res.error();

	HttpResponse response = std::move(res).value();
	response.body = decompress_body(
		std::move(body), response.header("content-encoding").value_or(""));
	return response;
}

Result<HttpResponse> HttpClient::stream(std::string_view url,
										const Headers &headers,
										const RequestOptions &options,
										HeaderSink on_header, BodySink on_body) {
	return m_impl->execute(
		http::verb::get, url, headers, options, on_header, on_body);
}

}  // namespace ffdl::net
