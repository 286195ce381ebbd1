#include <algorithm>
#include <ffdl/range_planner.hpp>

namespace ffdl {

std::vector<ByteRange> plan_ranges(std::uint64_t total_bytes,
								   std::uint64_t chunk_size) {
	std::vector<ByteRange> ranges;
	if (total_bytes == 0 || chunk_size == 0) return ranges;

	ranges.reserve(static_cast<size_t>((total_bytes + chunk_size - 1) / chunk_size));
	for (std::uint64_t start = 0; start < total_bytes;) {
		std::uint64_t len = std::min(chunk_size, total_bytes - start);
		ranges.push_back({start, start + len - 1});
		start += len;
	}
	return ranges;
}

}  // namespace ffdl
