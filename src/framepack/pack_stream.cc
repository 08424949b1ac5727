//
// Sequential pack stream and the put/get convenience calls.
//

#include <exception>
#include <system_error>

#include <framepack/pack_stream.hh>
#include <framepack/exceptions.hh>
#include "input.hh"

namespace framepack {

    namespace {
        // Failures outside the pack_error hierarchy, e.g. std::bad_alloc
        error_info unexpected_failure(const std::exception& e) {
            return error_info{error_kind::io_error, build_error_msg("Unexpected failure: ", e.what())};
        }
    }

    pack_stream::pack_stream()
        : pack_stream(pack_options{}) {
    }

    pack_stream::pack_stream(const pack_options& options)
        : m_options(options)
        , m_mode(options.mode) {
    }

    pack_stream::~pack_stream() {
        close();
    }

    result<void> pack_stream::open_write(const std::filesystem::path& path, bool rewrite) {
        return open(path, rewrite, false);
    }

    result<void> pack_stream::open_read(const std::filesystem::path& path) {
        return open(path, false, true);
    }

    result<void> pack_stream::open(const std::filesystem::path& path, bool rewrite, bool readonly) {
        close();
        m_last_error.clear();
        m_path = path;
        m_blocks = 0;

        try {
            if (readonly) {
                m_file.open(path, std::ios::in | std::ios::binary);
                THROW_IO_UNLESS(m_file.is_open(), "Cannot open pack file '", path.string(), "' for reading");

                m_mode = read_header(m_file, std::nullopt);
                m_state = state::open_for_read;
            } else {
                // An existing but empty file is treated like a new one
                std::error_code ec;
                bool append = false;
                if (!rewrite && std::filesystem::exists(path, ec)) {
                    auto size = std::filesystem::file_size(path, ec);
                    append = ec || size > 0;
                }

                if (append) {
                    m_file.open(path, std::ios::in | std::ios::out | std::ios::binary);
                    THROW_IO_UNLESS(m_file.is_open(), "Cannot open pack file '", path.string(), "' for appending");

                    read_header(m_file, m_options.mode);
                    m_file.seekp(0, std::ios::end);
                    THROW_IO_IF(m_file.fail(), "Cannot seek to the end of '", path.string(), "'");
                } else {
                    m_file.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
                    THROW_IO_UNLESS(m_file.is_open(), "Cannot create pack file '", path.string(), "'");

                    write_header(m_file, m_options.mode);
                    writer(m_file).flush();
                }

                m_mode = m_options.mode;
                m_state = state::open_for_write;
            }

            m_codec = block_codec::create(m_mode, m_options);
        } catch (const pack_error& e) {
            return result<void>::failure(record(to_error_info(e), true));
        } catch (const std::exception& e) {
            return result<void>::failure(record(unexpected_failure(e), true));
        }

        return result<void>::success();
    }

    result<void> pack_stream::write_block(const void* data, std::size_t size) {
        if (m_state != state::open_for_write) {
            return result<void>::failure(record({error_kind::invalid_state,
                                                 "Pack stream is not open for writing"}, false));
        }

        try {
            m_codec->write(m_file, data, size);
            writer(m_file).flush();
            m_blocks++;
        } catch (const limit_error& e) {
            // Nothing reached the file, the stream is still at a block boundary
            return result<void>::failure(record(to_error_info(e), false));
        } catch (const pack_error& e) {
            return result<void>::failure(record(to_error_info(e), true));
        } catch (const std::exception& e) {
            return result<void>::failure(record(unexpected_failure(e), true));
        }

        return result<void>::success();
    }

    result<void> pack_stream::write_block(const std::vector<std::byte>& data) {
        return write_block(data.data(), data.size());
    }

    result<void> pack_stream::write_block(std::string_view data) {
        return write_block(data.data(), data.size());
    }

    result<std::optional<std::vector<std::byte>>> pack_stream::read_next_block(bool decode) {
        using block_result = result<std::optional<std::vector<std::byte>>>;

        if (m_state != state::open_for_read) {
            return block_result::failure(record({error_kind::invalid_state,
                                                 "Pack stream is not open for reading"}, false));
        }

        try {
            std::optional<std::vector<std::byte>> block;
            if (decode) {
                block = m_codec->read(m_file);
            } else if (m_codec->skip(m_file)) {
                block.emplace();
            }

            if (block) {
                m_blocks++;
            }
            return block_result::success(std::move(block));
        } catch (const pack_error& e) {
            return block_result::failure(record(to_error_info(e), true));
        } catch (const std::exception& e) {
            return block_result::failure(record(unexpected_failure(e), true));
        }
    }

    result<bool> pack_stream::skip_block() {
        auto block = read_next_block(false);
        if (!block) {
            return result<bool>::failure(block.error());
        }
        return result<bool>::success(block.value().has_value());
    }

    void pack_stream::close() noexcept {
        if (m_file.is_open()) {
            m_file.close();
        }
        m_file.clear();
        m_codec.reset();
        m_state = state::closed;
    }

    error_info pack_stream::record(error_info error, bool close_stream) {
        m_last_error = error.message;
        if (close_stream) {
            close();
        }
        return error;
    }

    result<void> put(const std::filesystem::path& path, const void* data, std::size_t size,
                     bool rewrite, const pack_options& options) {
        pack_stream pack(options);

        auto opened = pack.open_write(path, rewrite);
        if (!opened) {
            return result<void>::failure(opened.kind(), "Cannot open pack for writing: " + opened.message());
        }

        auto written = pack.write_block(data, size);
        pack.close();
        if (!written) {
            return result<void>::failure(written.kind(), "Cannot write block to pack: " + written.message());
        }

        return result<void>::success();
    }

    result<std::vector<std::byte>> get(const std::filesystem::path& path, std::int64_t index,
                                       const pack_options& options) {
        using bytes_result = result<std::vector<std::byte>>;

        if (index <= 0) {
            index = 1;
        }

        pack_stream pack(options);
        auto opened = pack.open_read(path);
        if (!opened) {
            return bytes_result::failure(opened.kind(), "Cannot open pack for reading: " + opened.message());
        }

        for (std::int64_t i = 1; i <= index; i++) {
            auto block = pack.read_next_block(i == index);
            if (!block) {
                return bytes_result::failure(block.kind(),
                    build_error_msg("Cannot read block #", i, ": ", block.message()));
            }
            if (!block.value()) {
                return bytes_result::failure(error_kind::block_not_found,
                    build_error_msg("Block #", index, " does not exist, the pack holds ", i - 1, " blocks"));
            }
            if (i == index) {
                return bytes_result::success(std::move(*block.value()));
            }
        }

        // make compiler happy
        return bytes_result::failure(error_kind::block_not_found, build_error_msg("Block #", index, " does not exist"));
    }

} // namespace framepack
