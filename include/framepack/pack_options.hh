/**
 * @file pack_options.hh
 * @brief Configuration shared by pack streams and file transfers
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>
#include <framepack/framepack_config.h>
#include <framepack/header.hh>

namespace framepack {

    /**
     * @struct pack_options
     * @brief Configuration options for writing and reading pack files
     */
    struct pack_options {
        /**
         * @brief Block encoding used when creating or appending to a pack
         *
         * Ignored when reading: a stream opened for reading adopts the
         * mode recorded in the file header.
         */
        pack_mode mode = pack_mode::binary;

        /**
         * @brief Maximum raw size of one block, and the split size for files
         *
         * A single write larger than this fails with block_too_large.
         * Zero disables the single-block limit but cannot be used to pack
         * files. Default is 10MB.
         */
        std::uint64_t chunk_size = FRAMEPACK_DEFAULT_CHUNK_SIZE;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Pack file offset where the warning occurred (0 if not applicable)
         * @param category Warning category (e.g., "partial_output", "mime_fallback")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues. If not set,
         * warnings are silently ignored.
         */
        warning_handler on_warning;

        void warn(std::uint64_t offset, std::string_view category, std::string_view message) const {
            if (on_warning) {
                on_warning(offset, category, message);
            }
        }
    };

} // namespace framepack
