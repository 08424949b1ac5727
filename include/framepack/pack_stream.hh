/**
 * @file pack_stream.hh
 * @brief Sequential reading and appending of blocks in a pack file
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <framepack/export_framepack.h>
#include <framepack/block_codec.hh>
#include <framepack/pack_options.hh>
#include <framepack/result.hh>

namespace framepack {

    /**
     * @class pack_stream
     * @brief Exclusive handle on one pack file, opened for appending or for reading
     *
     * The stream moves through closed -> open_for_write | open_for_read ->
     * closed. Its access mode is fixed at open time; a stream never
     * interleaves reads and writes. Every operation returns a result and
     * records the failure text in last_error(). A failure that may have
     * left the file position inside a block closes the stream.
     *
     * @code
     * framepack::pack_stream pack;
     * if (pack.open_read("cache.pack")) {
     *     while (true) {
     *         auto block = pack.read_next_block();
     *         if (!block || !block.value()) break;
     *         consume(*block.value());
     *     }
     * }
     * @endcode
     */
    class FRAMEPACK_EXPORT pack_stream {
    public:
        enum class state {
            closed,
            open_for_write,
            open_for_read
        };

        pack_stream();
        explicit pack_stream(const pack_options& options);
        ~pack_stream();

        pack_stream(const pack_stream&) = delete;
        pack_stream& operator = (const pack_stream&) = delete;

        pack_stream(pack_stream&&) = default;
        pack_stream& operator = (pack_stream&&) = default;

        /**
         * @brief Open a pack for appending blocks
         * @param path Pack file
         * @param rewrite True to truncate an existing file
         *
         * A new, empty or rewritten file gets a fresh header in the
         * configured mode. An existing file must carry a header in that
         * same mode (header_mismatch otherwise) and is positioned at its end.
         */
        result<void> open_write(const std::filesystem::path& path, bool rewrite = false);

        /**
         * @brief Open a pack for reading; the stream adopts the file's mode
         */
        result<void> open_read(const std::filesystem::path& path);

        /**
         * @brief Append one block
         *
         * block_too_large and unsupported_size leave the stream open since
         * nothing was written; any other failure closes it.
         */
        result<void> write_block(const void* data, std::size_t size);
        result<void> write_block(const std::vector<std::byte>& data);
        result<void> write_block(std::string_view data);

        /**
         * @brief Read the next block
         * @param decode False to only advance past the block (no digest
         *               check, no decompression); an empty vector is returned
         * @return The block, or nullopt at a clean end of the pack
         */
        result<std::optional<std::vector<std::byte>>> read_next_block(bool decode = true);

        /**
         * @brief Advance past the next block
         * @return True if a block was skipped, false at a clean end of the pack
         */
        result<bool> skip_block();

        /**
         * @brief Release the file; safe to call on a closed stream
         */
        void close() noexcept;

        [[nodiscard]] pack_mode mode() const { return m_mode; }
        [[nodiscard]] std::string_view mode_name() const { return framepack::mode_name(m_mode); }
        [[nodiscard]] state current_state() const { return m_state; }
        [[nodiscard]] bool is_open() const { return m_state != state::closed; }

        /// Blocks written or read since the stream was opened
        [[nodiscard]] std::uint64_t block_count() const { return m_blocks; }

        [[nodiscard]] const std::string& last_error() const { return m_last_error; }
        [[nodiscard]] const std::filesystem::path& path() const { return m_path; }
        [[nodiscard]] const pack_options& options() const { return m_options; }

    private:
        result<void> open(const std::filesystem::path& path, bool rewrite, bool readonly);
        error_info record(error_info error, bool close_stream);

        pack_options m_options;
        pack_mode m_mode;
        state m_state = state::closed;
        std::fstream m_file;
        std::unique_ptr<block_codec> m_codec;
        std::filesystem::path m_path;
        std::string m_last_error;
        std::uint64_t m_blocks = 0;
    };

    /**
     * @brief Open a pack for writing, append one block, close it
     *
     * All arguments are required here so that put(path, "text", true)
     * resolves to the string_view overload.
     */
    FRAMEPACK_EXPORT result<void> put(const std::filesystem::path& path, const void* data, std::size_t size,
                                      bool rewrite, const pack_options& options);

    inline result<void> put(const std::filesystem::path& path, std::string_view data,
                            bool rewrite = false, const pack_options& options = {}) {
        return put(path, data.data(), data.size(), rewrite, options);
    }

    inline result<void> put(const std::filesystem::path& path, const std::vector<std::byte>& data,
                            bool rewrite = false, const pack_options& options = {}) {
        return put(path, data.data(), data.size(), rewrite, options);
    }

    /**
     * @brief Read block number index (the first block is 1) from a pack
     *
     * Blocks before index are skipped without being decoded. An index of 0
     * or below reads the first block. Fails with block_not_found when the
     * pack holds fewer blocks.
     */
    FRAMEPACK_EXPORT result<std::vector<std::byte>> get(const std::filesystem::path& path, std::int64_t index = 1,
                                                        const pack_options& options = {});

} // namespace framepack
