/**
 * @file file_info.hh
 * @brief Metadata record stored as the first block of a packed file
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <cstdint>
#include <framepack/export_framepack.h>
#include <framepack/pack_options.hh>
#include <framepack/result.hh>

namespace framepack {

    /**
     * @struct file_info
     * @brief Description of a file packed in chunks
     *
     * Serialized as a PHP style associative array with the keys
     * "file", "date", "size", "mime" and "chks", which keeps packs
     * interchangeable with the tool that introduced the format.
     */
    struct file_info {
        std::string file;        ///< Base name of the original file
        std::int64_t date = 0;   ///< Modification time, seconds since the epoch
        std::uint64_t size = 0;  ///< Size of the original file in bytes
        std::string mime;        ///< MIME type, e.g. "image/png"
        std::uint64_t chunks = 0;///< Number of data blocks following the record

        /**
         * @brief True if every field holds a usable value
         *
         * Requires a name, a positive date, a MIME type and at least one chunk.
         */
        [[nodiscard]] bool valid() const {
            return !file.empty() && date > 0 && !mime.empty() && chunks > 0;
        }

        bool operator == (const file_info& other) const = default;
    };

    /**
     * @brief Number of chunks a file of the given size is split into
     *
     * ceil(size / chunk_size), and at least one even for empty files.
     */
    constexpr std::uint64_t chunk_count(std::uint64_t size, std::uint64_t chunk_size) {
        if (chunk_size == 0 || size <= chunk_size) {
            return 1;
        }
        return (size + chunk_size - 1) / chunk_size;
    }

    /**
     * @brief Serialize a record for storage in a metadata block
     */
    FRAMEPACK_EXPORT std::string serialize(const file_info& info);

    /**
     * @brief Parse a metadata block
     *
     * Integer fields may be stored as integers or as integral floating
     * point numbers. Unknown keys are ignored.
     * @return The record, or corrupt_metadata if the text is malformed or
     *         a required field is missing or invalid
     */
    FRAMEPACK_EXPORT result<file_info> parse_file_info(std::string_view text);

    /**
     * @brief Describe a file on disk for packing
     * @param path Regular file
     * @param chunk_size Split size used to compute the chunk count
     * @param options Warnings are reported through options.on_warning
     *                (e.g. when the MIME type cannot be detected)
     */
    FRAMEPACK_EXPORT result<file_info> describe_file(const std::filesystem::path& path, std::uint64_t chunk_size,
                                                     const pack_options& options = {});

    /**
     * @brief Convert a file time to seconds since the epoch
     */
    FRAMEPACK_EXPORT std::int64_t to_epoch_seconds(std::filesystem::file_time_type time);

    /**
     * @brief Convert seconds since the epoch to a file time
     */
    FRAMEPACK_EXPORT std::filesystem::file_time_type from_epoch_seconds(std::int64_t seconds);

} // namespace framepack
