/**
 * @file length_codec.hh
 * @brief Variable length little-endian encoding of block sizes
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <framepack/export_framepack.h>

namespace framepack {

    /// At most 7 bytes are used, so encodable values are below 2^56
    inline constexpr std::size_t max_length_bytes = 7;

    class length_bytes;

    /**
     * @brief Encode a length as little-endian bytes
     * @param value Value to encode
     * @return Encoded bytes (empty for zero)
     * @throws limit_error (unsupported_size) if more than 7 bytes are needed
     */
    FRAMEPACK_EXPORT length_bytes encode_length(std::uint64_t value);

    /**
     * @class length_bytes
     * @brief Encoded length: up to max_length_bytes little-endian bytes
     *
     * The most significant zero bytes are dropped, so the number of bytes
     * varies with the value. Zero is encoded as no bytes at all.
     */
    class length_bytes {
    public:
        constexpr length_bytes() = default;

        [[nodiscard]] constexpr std::size_t size() const { return m_count; }
        [[nodiscard]] constexpr bool empty() const { return m_count == 0; }
        [[nodiscard]] const std::uint8_t* data() const { return m_bytes.data(); }

        constexpr std::uint8_t operator[](std::size_t i) const { return m_bytes[i]; }

        [[nodiscard]] auto begin() const { return m_bytes.begin(); }
        [[nodiscard]] auto end() const { return m_bytes.begin() + static_cast<std::ptrdiff_t>(m_count); }

    private:
        friend length_bytes encode_length(std::uint64_t value);

        std::array<std::uint8_t, max_length_bytes> m_bytes{};
        std::size_t m_count = 0;
    };

    /**
     * @brief Decode little-endian length bytes
     * @param data Encoded bytes
     * @param count Number of bytes, 0 decodes to 0
     * @throws limit_error (unsupported_size) if count exceeds 7
     */
    FRAMEPACK_EXPORT std::uint64_t decode_length(const std::uint8_t* data, std::size_t count);

    inline std::uint64_t decode_length(const length_bytes& bytes) {
        return decode_length(bytes.data(), bytes.size());
    }

} // namespace framepack
