/**
 * @file file_transfer.hh
 * @brief Packing whole files in chunks and restoring them
 *
 * A packed file is a pack whose first block is a serialized file_info
 * followed by exactly file_info::chunks data blocks of at most
 * pack_options::chunk_size bytes each.
 */

#pragma once

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>
#include <cstdint>
#include <framepack/export_framepack.h>
#include <framepack/file_info.hh>
#include <framepack/pack_options.hh>
#include <framepack/result.hh>

namespace framepack {

    /**
     * @brief Split a file into chunks and store it in a new pack
     * @param src File to pack
     * @param dest Pack file to create
     * @param remove_src Delete src once the pack is complete
     * @param replace_dest Overwrite dest if it exists (io_error otherwise)
     * @param options Mode, chunk size (must be positive) and warning handler
     * @return Number of data blocks written
     *
     * On failure the partially written dest is left in place, and a
     * "partial_output" warning is emitted; the caller decides whether to
     * delete it.
     */
    FRAMEPACK_EXPORT result<std::uint64_t> compress_file(const std::filesystem::path& src,
                                                         const std::filesystem::path& dest,
                                                         bool remove_src = false,
                                                         bool replace_dest = false,
                                                         const pack_options& options = {});

    /**
     * @brief Restore a packed file
     * @param src Pack produced by compress_file
     * @param dest File to create
     * @param replace_dest Overwrite dest if it exists (io_error otherwise)
     * @return The stored file_info
     *
     * The restored size must match the recorded one (size_mismatch
     * otherwise). On any failure dest is deleted. On success its
     * modification time is set to the recorded date.
     */
    FRAMEPACK_EXPORT result<file_info> uncompress_file(const std::filesystem::path& src,
                                                       const std::filesystem::path& dest,
                                                       bool replace_dest = false,
                                                       const pack_options& options = {});

    /**
     * @typedef file_info_handler
     * @brief Called with the stored file_info before the first payload byte is streamed
     */
    using file_info_handler = std::function<void(const file_info& info)>;

    /**
     * @brief Stream a packed file to an output stream
     * @param src Pack produced by compress_file
     * @param sink Destination stream, e.g. std::cout for browser delivery
     * @param on_file_info Header hook; pass an empty handler to suppress
     *                     header hints
     * @return The stored file_info
     *
     * A sink that stops accepting bytes yields size_mismatch.
     */
    FRAMEPACK_EXPORT result<file_info> export_file(const std::filesystem::path& src,
                                                   std::ostream& sink,
                                                   const file_info_handler& on_file_info = {},
                                                   const pack_options& options = {});

    /**
     * @brief Read only the file_info of a packed file
     */
    FRAMEPACK_EXPORT result<file_info> read_file_info(const std::filesystem::path& src,
                                                      const pack_options& options = {});

    /// One HTTP header line: name and value
    using http_header = std::pair<std::string, std::string>;

    /**
     * @brief Headers a browser delivery layer sends before export_file output
     *
     * Content-type, Content-Disposition (inline for images, attachment
     * with the stored file name otherwise), Content-Length, Pragma and
     * Expires.
     */
    FRAMEPACK_EXPORT std::vector<http_header> download_headers(const file_info& info);

} // namespace framepack
