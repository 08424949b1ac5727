/**
 * @file exceptions.hh
 * @brief Error kinds, exception classes and throwing macros for framepack
 *
 * The codecs report failures by throwing one of the classes below. The
 * stream and transfer layers catch them at their public boundary and turn
 * them into result values (see result.hh).
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <sstream>
#include <framepack/export_framepack.h>

namespace framepack {

    /**
     * @enum error_kind
     * @brief Classification of every failure the library can report
     */
    enum class error_kind {
        header_mismatch,   ///< Wrong magic/version, unknown mode, or mode conflict on open
        unsupported_size,  ///< Value needs more than 7 length bytes
        block_too_large,   ///< Payload is larger than the configured chunk size
        corrupt_block,     ///< Malformed block framing or decompression failure
        checksum_mismatch, ///< Text-mode digest disagreement
        io_error,          ///< Short read/write, cannot open or create
        corrupt_metadata,  ///< FileInfo block missing or malformed
        size_mismatch,     ///< Reassembled size differs from the recorded one
        unexpected_eof,    ///< Block expected but the pack ended
        block_not_found,   ///< Requested block index is past the last block
        invalid_state,     ///< Operation not allowed in the stream's current state
        invalid_argument   ///< Caller supplied an unusable parameter
    };

    /**
     * @brief Stable lowercase name of an error kind, e.g. "checksum_mismatch"
     */
    FRAMEPACK_EXPORT std::string_view to_string(error_kind kind) noexcept;

    /**
     * @class pack_error
     * @brief Base exception class for all framepack errors
     */
    class FRAMEPACK_EXPORT pack_error : public std::runtime_error {
    public:
        pack_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class io_error
     * @brief Thrown when opening, reading, writing or seeking fails
     */
    class FRAMEPACK_EXPORT io_error : public pack_error {
    public:
        explicit io_error(const std::string& msg)
            : pack_error(error_kind::io_error, msg) {}

        io_error(error_kind kind, const std::string& msg)
            : pack_error(kind, msg) {}
    };

    /**
     * @class format_error
     * @brief Thrown when stored bytes violate the pack format
     *
     * Covers header mismatches, corrupt blocks, checksum failures and
     * unusable metadata.
     */
    class FRAMEPACK_EXPORT format_error : public pack_error {
    public:
        format_error(error_kind kind, const std::string& msg)
            : pack_error(kind, msg) {}
    };

    /**
     * @class limit_error
     * @brief Thrown when a size does not fit the format or configuration
     */
    class FRAMEPACK_EXPORT limit_error : public pack_error {
    public:
        limit_error(error_kind kind, const std::string& msg)
            : pack_error(kind, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    #define THROW_IO(...) \
        throw ::framepack::io_error(::framepack::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_EOF_IF(condition, ...) \
        do { if (condition) throw ::framepack::io_error(::framepack::error_kind::unexpected_eof, \
                ::framepack::build_error_msg(__VA_ARGS__)); } while(0)

    #define THROW_FORMAT(kind, ...) \
        throw ::framepack::format_error(::framepack::error_kind::kind, ::framepack::build_error_msg(__VA_ARGS__))

    #define THROW_FORMAT_IF(condition, kind, ...) \
        do { if (condition) THROW_FORMAT(kind, __VA_ARGS__); } while(0)

    #define THROW_FORMAT_UNLESS(condition, kind, ...) \
        do { if (!(condition)) THROW_FORMAT(kind, __VA_ARGS__); } while(0)

    #define THROW_LIMIT(kind, ...) \
        throw ::framepack::limit_error(::framepack::error_kind::kind, ::framepack::build_error_msg(__VA_ARGS__))

    #define THROW_LIMIT_IF(condition, kind, ...) \
        do { if (condition) THROW_LIMIT(kind, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace framepack
