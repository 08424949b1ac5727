//
// Little-endian length prefix used by binary blocks.
//

#include <framepack/length_codec.hh>
#include <framepack/exceptions.hh>

namespace framepack {

    length_bytes encode_length(std::uint64_t value) {
        length_bytes out;
        const std::uint64_t original = value;

        while (value > 0) {
            THROW_LIMIT_IF(out.m_count == max_length_bytes, unsupported_size,
                           "Length ", original, " needs more than ", max_length_bytes, " bytes");
            out.m_bytes[out.m_count++] = static_cast<std::uint8_t>(value & 0xFF);
            value >>= 8;
        }

        return out;
    }

    std::uint64_t decode_length(const std::uint8_t* data, std::size_t count) {
        THROW_LIMIT_IF(count > max_length_bytes, unsupported_size,
                       "Length prefix of ", count, " bytes is not supported (maximum ", max_length_bytes, ")");

        std::uint64_t value = 0;
        for (std::size_t i = 0; i < count; i++) {
            value |= static_cast<std::uint64_t>(data[i]) << (i * 8);
        }
        return value;
    }

} // namespace framepack
