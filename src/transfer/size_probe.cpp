#include <spdlog/spdlog.h>

#include <boost/algorithm/string/predicate.hpp>
#include <ffdl/http_client.hpp>
#include <ffdl/size_probe.hpp>

#include "utils.hpp"

namespace ffdl {

SizeProbe::SizeProbe(std::shared_ptr<net::HttpClient> http,
					 std::chrono::seconds timeout)
	: http_(std::move(http)), timeout_(timeout) {}

ProbeResult SizeProbe::probe(std::string_view url) const {
	ProbeResult result;

	auto res = http_->head(url, {}, timeout_);
	if (!res) {
		spdlog::debug("HEAD {} failed: {}", url, res.error().message());
		return result;
	}
	const auto &head = res.value();
	if (!head.ok()) {
		spdlog::debug("HEAD {} returned status {}", url, head.status_code);
		return result;
	}

	if (auto cl = head.header("content-length")) {
		auto len = utils::to_u64(*cl);
		if (len) result.total_bytes = len.value();
	}
	if (auto ar = head.header("accept-ranges")) {
		result.supports_ranges = boost::algorithm::icontains(*ar, "bytes");
	}

	spdlog::debug("Probe {}: {} bytes, ranges {}", url, result.total_bytes,
				  result.supports_ranges ? "yes" : "no");
	return result;
}

}  // namespace ffdl
