#pragma once

#include <ffdl/ffdl_export.h>

#include <chrono>
#include <memory>
#include <string_view>

#include "types.hpp"

namespace ffdl::net {
class HttpClient;
}

namespace ffdl {

/// HEAD request for size and byte-range support. Never fails: any error
/// yields {0, false}, meaning "unknown, stream it in one piece".
class FFDL_EXPORT SizeProbe {
   public:
	static constexpr auto kDefaultTimeout = std::chrono::seconds(10);

	explicit SizeProbe(std::shared_ptr<net::HttpClient> http,
					   std::chrono::seconds timeout = kDefaultTimeout);

	[[nodiscard]] ProbeResult probe(std::string_view url) const;

   private:
	std::shared_ptr<net::HttpClient> http_;
	std::chrono::seconds timeout_;
};

}  // namespace ffdl
