/**
 * @file block_codec.hh
 * @brief Framing of individual blocks inside a pack file
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <vector>
#include <cstddef>
#include <framepack/export_framepack.h>
#include <framepack/header.hh>
#include <framepack/pack_options.hh>

namespace framepack {

    /**
     * @class block_codec
     * @brief Encodes and decodes one block at a time in a given mode
     *
     * Binary blocks are zlib streams prefixed with their length; text
     * blocks are unpadded base64 wrapped at 1024 columns, preceded by a
     * "#<hex length>:<md5>" line. Codecs are stateless: the position in the
     * pack is the position of the stream passed in.
     */
    class FRAMEPACK_EXPORT block_codec {
    public:
        /// Width of the base64 lines in text blocks
        static constexpr std::size_t text_line_width = 1024;

        /// Decoded blocks may always reach this size, so metadata records
        /// stay readable with tiny chunk sizes
        static constexpr std::size_t min_decode_limit = 64 * 1024;

        /**
         * @brief Factory returning the codec for a mode
         * @param mode Block encoding
         * @param options Options (chunk_size is the single block limit)
         */
        static std::unique_ptr<block_codec> create(pack_mode mode, const pack_options& options);

        static std::unique_ptr<block_codec> create(pack_mode mode);

        virtual ~block_codec() = default;

        [[nodiscard]] virtual pack_mode mode() const = 0;

        /**
         * @brief Build the complete on-disk frame for a payload
         * @throws limit_error (block_too_large) if size exceeds the chunk size,
         *         limit_error (unsupported_size) if the encoded size needs
         *         more than 7 length bytes
         */
        [[nodiscard]] std::vector<std::byte> encode(const void* data, std::size_t size) const;

        /**
         * @brief Encode a payload and write the frame with a single write
         *
         * Nothing is written when encoding fails.
         * @throws io_error on a short write, plus everything encode() throws
         */
        void write(std::ostream& os, const void* data, std::size_t size) const;

        /**
         * @brief Read and decode the block at the current stream position
         * @return Decoded payload, or nullopt at a clean end of the pack
         * @throws format_error (corrupt_block, checksum_mismatch) on damaged
         *         blocks, io_error (unexpected_eof) on truncated ones
         */
        virtual std::optional<std::vector<std::byte>> read(std::istream& is) const = 0;

        /**
         * @brief Advance past the block at the current position without decoding it
         * @return False at a clean end of the pack
         */
        virtual bool skip(std::istream& is) const = 0;

        /**
         * @brief Largest decoded block read() accepts
         *
         * The chunk size (at least min_decode_limit), or no limit when the
         * chunk size is zero. Larger blocks are reported as corrupt_block.
         */
        [[nodiscard]] std::size_t decode_limit() const;

    protected:
        explicit block_codec(const pack_options& options) : m_options(options) {}

        virtual std::vector<std::byte> encode_frame(const void* data, std::size_t size) const = 0;

        pack_options m_options;
    };

} // namespace framepack
