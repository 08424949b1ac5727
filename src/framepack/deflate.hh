//
// zlib helpers for binary blocks.
//

#pragma once

#include <cstddef>
#include <limits>
#include <vector>

namespace framepack::deflate {

    // zlib level used for blocks below the fast threshold
    inline constexpr int best_level = 9;

    // zlib level used for blocks of fast_threshold bytes and above
    inline constexpr int fast_level = 7;

    inline constexpr std::size_t fast_threshold = 1045504;

    inline int level_for(std::size_t raw_size) {
        return raw_size >= fast_threshold ? fast_level : best_level;
    }

    // zlib-format stream (header + deflate data + adler32), throws io_error on failure
    std::vector<std::byte> compress(const void* data, std::size_t size, int level);

    // Inverse of compress, throws format_error (corrupt_block) on damaged input
    // or when the output would exceed max_output bytes
    std::vector<std::byte> uncompress(const void* data, std::size_t size,
                                      std::size_t max_output = std::numeric_limits<std::size_t>::max());
}
