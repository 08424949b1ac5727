/**
 * @file header.hh
 * @brief Pack file header: magic, version and block encoding mode
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <string_view>
#include <cstddef>
#include <framepack/export_framepack.h>

namespace framepack {

    /**
     * @enum pack_mode
     * @brief Block encoding used by a whole pack file
     */
    enum class pack_mode {
        binary, ///< zlib-compressed blocks with a binary length prefix
        text    ///< base64 blocks with a textual header line and MD5 digest
    };

    /// Magic string and version tag every pack file starts with
    inline constexpr std::string_view pack_magic = "MIFRAMEPACK/1.0/";

    /// Magic + version + one mode character
    inline constexpr std::size_t pack_header_size = pack_magic.size() + 1;

    /**
     * @brief Mode character stored in the header: 'B' or 'T'
     */
    constexpr char mode_char(pack_mode mode) noexcept {
        return mode == pack_mode::binary ? 'B' : 'T';
    }

    /**
     * @brief Human readable mode name: "binary" or "text"
     */
    constexpr std::string_view mode_name(pack_mode mode) noexcept {
        return mode == pack_mode::binary ? "binary" : "text";
    }

    /**
     * @brief Write the header for a new pack file
     * @param os Output stream positioned at the start of the file
     * @param mode Mode of the blocks that will follow
     * @throws io_error on a short write
     */
    FRAMEPACK_EXPORT void write_header(std::ostream& os, pack_mode mode);

    /**
     * @brief Read and validate a pack header
     * @param is Input stream positioned at the start of the file
     * @param expected Mode the caller is about to write in, or nullopt when
     *                 the file is opened read-only and adopts the stored mode
     * @return Mode recorded in the file
     * @throws format_error (header_mismatch) on a short read, a wrong
     *         magic/version, an unknown mode character or a mode conflict
     */
    FRAMEPACK_EXPORT pack_mode read_header(std::istream& is, std::optional<pack_mode> expected);

} // namespace framepack
