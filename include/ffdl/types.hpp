#pragma once

#include <ffdl/ffdl_export.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ffdl {

inline constexpr std::uint64_t kKiB = 1024;
inline constexpr std::uint64_t kMiB = 1024 * kKiB;

// Inclusive byte interval [start, end]
struct FFDL_EXPORT ByteRange {
	std::uint64_t start = 0;
	std::uint64_t end = 0;

	[[nodiscard]] std::uint64_t length() const { return end - start + 1; }

	bool operator==(const ByteRange &) const = default;
};

struct FFDL_EXPORT ResolvedTarget {
	std::string filename;
	std::string direct_url;
};

struct FFDL_EXPORT ProbeResult {
	std::uint64_t total_bytes = 0;	// 0 when unknown
	bool supports_ranges = false;
};

struct FFDL_EXPORT SpeedSample {
	double current_bps = 0.0;
	double overall_bps = 0.0;
	std::optional<double> eta_seconds;	// Unset when unavailable
};

struct FFDL_EXPORT FailedLink {
	std::string link;
	std::string error;
};

struct FFDL_EXPORT SessionOutcome {
	std::vector<std::string> completed;
	std::vector<FailedLink> failed;
};

enum class TransferStrategy { single_stream, chunked };

}  // namespace ffdl
