#pragma once

#include <fmt/format.h>

#include <boost/charconv.hpp>
#include <cstdint>
#include <ffdl/result.hpp>
#include <ffdl/types.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace ffdl::utils {

// =============================================================================
// Safe numeric conversions utilizing boost::charconv
// =============================================================================

template <typename T>
Result<T> to_number(std::string_view sv) {
	T val;
	auto res =
		boost::charconv::from_chars(sv.data(), sv.data() + sv.size(), val);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return make_error_code(errc::invalid_number_format);
}

inline Result<std::uint64_t> to_u64(std::string_view sv) {
	while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) {
		sv.remove_prefix(1);
	}
	while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) {
		sv.remove_suffix(1);
	}
	return to_number<std::uint64_t>(sv);
}

// =============================================================================
// Human-readable formatting
// =============================================================================

inline double to_mib(std::uint64_t bytes) {
	return static_cast<double>(bytes) / static_cast<double>(kMiB);
}

/// "12.3 MB/s" above 1 MiB/s, "512.0 KB/s" below
inline std::string format_speed(double bytes_per_sec) {
	double mib = bytes_per_sec / static_cast<double>(kMiB);
	if (mib >= 1.0) return fmt::format("{:.2f} MB/s", mib);
	return fmt::format("{:.1f} KB/s", bytes_per_sec / static_cast<double>(kKiB));
}

/// "01h 02m 03s", "02m 03s", "03s", or "N/A" when unknown
inline std::string format_eta(std::optional<double> seconds) {
	if (!seconds || *seconds <= 0) return "N/A";
	auto total = static_cast<long long>(*seconds);
	long long hours = total / 3600;
	long long minutes = (total % 3600) / 60;
	long long secs = total % 60;
	if (hours > 0) return fmt::format("{:02d}h {:02d}m {:02d}s", hours, minutes, secs);
	if (minutes > 0) return fmt::format("{:02d}m {:02d}s", minutes, secs);
	return fmt::format("{:02d}s", secs);
}

/// Shorten long links for log lines
inline std::string shorten(std::string_view s, std::size_t max_len) {
	if (s.size() <= max_len) return std::string(s);
	return fmt::format("{}...", s.substr(0, max_len));
}

}  // namespace ffdl::utils
