#pragma once

#include <ffdl/ffdl_export.h>

#include <cstdint>
#include <vector>

#include "types.hpp"

namespace ffdl {

inline constexpr std::uint64_t kDefaultChunkSize = 4 * kMiB;

/// Split [0, total_bytes) into consecutive ranges of at most chunk_size
/// bytes; the last one is truncated. Empty when either argument is 0.
FFDL_EXPORT std::vector<ByteRange> plan_ranges(
	std::uint64_t total_bytes, std::uint64_t chunk_size = kDefaultChunkSize);

}  // namespace ffdl
