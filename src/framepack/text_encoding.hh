//
// OpenSSL backed base64 and MD5 helpers for text blocks.
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace framepack::text_encoding {

    // Standard base64 alphabet, with '=' padding
    std::string base64_encode(const void* data, std::size_t size);

    // Accepts input with or without '=' padding; line breaks must already be removed.
    // Throws format_error (corrupt_block) on characters outside the alphabet.
    std::vector<std::byte> base64_decode(std::string_view encoded);

    // Lowercase hex MD5 digest (32 characters)
    std::string md5_hex(const void* data, std::size_t size);
}
