//
// Chunked packing and restoring of whole files.
//

#include <algorithm>
#include <fstream>
#include <new>
#include <optional>
#include <string>
#include <ostream>
#include <system_error>

#include <framepack/file_transfer.hh>
#include <framepack/pack_stream.hh>
#include <framepack/exceptions.hh>

namespace framepack {

    namespace {

        // Opens src for reading and decodes its leading file_info block
        result<file_info> open_packed_file(pack_stream& pack, const std::filesystem::path& src) {
            auto opened = pack.open_read(src);
            if (!opened) {
                return result<file_info>::failure(opened.kind(),
                    build_error_msg("Cannot open pack '", src.string(), "': ", opened.message()));
            }

            auto block = pack.read_next_block();
            if (!block) {
                return result<file_info>::failure(block.kind(),
                    build_error_msg("Cannot read the file information of '", src.string(), "': ", block.message()));
            }
            if (!block.value()) {
                pack.close();
                return result<file_info>::failure(error_kind::corrupt_metadata,
                    build_error_msg("Pack '", src.string(), "' holds no file information block"));
            }

            const auto& data = *block.value();
            std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
            auto info = parse_file_info(text);
            if (!info) {
                pack.close();
                return result<file_info>::failure(error_kind::corrupt_metadata,
                    build_error_msg("Invalid file information in '", src.string(), "': ", info.message()));
            }
            return info;
        }

        // Copies info.chunks blocks to sink and checks the total against info.size
        std::optional<error_info> stream_chunks(pack_stream& pack, const file_info& info, std::ostream& sink,
                                                const pack_options& options) {
            std::uint64_t total = 0;

            for (std::uint64_t i = 1; i <= info.chunks; i++) {
                auto block = pack.read_next_block();
                if (!block) {
                    return error_info{block.kind(),
                        build_error_msg("Cannot read chunk #", i, " of ", info.chunks, ": ", block.message())};
                }
                if (!block.value()) {
                    return error_info{error_kind::unexpected_eof,
                        build_error_msg("Pack ends after ", i - 1, " of ", info.chunks, " chunks")};
                }

                const auto& data = *block.value();
                sink.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
                if (!sink) {
                    return error_info{error_kind::size_mismatch,
                        build_error_msg("Writing chunk #", i, " to the destination failed after ", total,
                                        " of ", info.size, " bytes")};
                }
                total += data.size();
            }

            sink.flush();
            if (!sink) {
                return error_info{error_kind::size_mismatch,
                    build_error_msg("Flushing the destination failed after ", total, " of ", info.size, " bytes")};
            }

            if (total != info.size) {
                return error_info{error_kind::size_mismatch,
                    build_error_msg("Restored ", total, " bytes but the pack records ", info.size)};
            }

            auto extra = pack.skip_block();
            if (!extra) {
                options.warn(0, "trailing_data", "Unreadable data after the last chunk: " + extra.message());
            } else if (extra.value()) {
                options.warn(0, "trailing_data",
                             build_error_msg("Pack holds blocks after the last of ", info.chunks, " chunks"));
            }

            return std::nullopt;
        }
    }

    result<std::uint64_t> compress_file(const std::filesystem::path& src,
                                        const std::filesystem::path& dest,
                                        bool remove_src,
                                        bool replace_dest,
                                        const pack_options& options) {
        using count_result = result<std::uint64_t>;

        if (options.chunk_size == 0) {
            return count_result::failure(error_kind::invalid_argument, "Chunk size must be positive to pack a file");
        }

        auto info = describe_file(src, options.chunk_size, options);
        if (!info) {
            return count_result::failure(info.error());
        }

        std::error_code ec;
        if (!replace_dest && std::filesystem::exists(dest, ec)) {
            return count_result::failure(error_kind::io_error,
                build_error_msg("Destination '", dest.string(), "' already exists"));
        }

        std::ifstream source(src, std::ios::in | std::ios::binary);
        if (!source.is_open()) {
            return count_result::failure(error_kind::io_error,
                build_error_msg("Cannot open source file '", src.string(), "'"));
        }

        // The metadata block may be larger than a tiny chunk size
        std::string metadata = serialize(info.value());
        pack_options write_options = options;
        write_options.chunk_size = std::max<std::uint64_t>(options.chunk_size, metadata.size());

        pack_stream pack(write_options);
        auto opened = pack.open_write(dest, true);
        if (!opened) {
            return count_result::failure(opened.kind(),
                build_error_msg("Cannot create pack '", dest.string(), "': ", opened.message()));
        }

        auto abandon = [&](error_kind kind, const std::string& message) {
            pack.close();
            options.warn(0, "partial_output",
                         build_error_msg("Incomplete pack left at '", dest.string(), "'"));
            return count_result::failure(kind, message);
        };

        auto header = pack.write_block(metadata);
        if (!header) {
            return abandon(header.kind(), "Cannot write the file information block: " + header.message());
        }

        // Never allocate more than the file needs, the count check catches files that grew
        const auto chunk = static_cast<std::size_t>(
            std::clamp<std::uint64_t>(info.value().size, 1, options.chunk_size));
        std::vector<char> buffer;
        try {
            buffer.resize(chunk);
        } catch (const std::bad_alloc&) {
            return abandon(error_kind::invalid_argument,
                build_error_msg("Cannot allocate a chunk buffer of ", chunk, " bytes"));
        }
        std::uint64_t written = 0;

        while (true) {
            source.read(buffer.data(), static_cast<std::streamsize>(chunk));
            if (source.bad()) {
                return abandon(error_kind::io_error,
                    build_error_msg("Cannot read chunk #", written + 1, " from '", src.string(), "'"));
            }

            auto count = static_cast<std::size_t>(source.gcount());
            if (count == 0 && written > 0) {
                break;
            }

            auto block = pack.write_block(buffer.data(), count);
            if (!block) {
                return abandon(block.kind(),
                    build_error_msg("Cannot write chunk #", written + 1, ": ", block.message()));
            }
            written++;

            if (count < chunk) {
                break;
            }
        }

        if (written != info.value().chunks) {
            return abandon(error_kind::size_mismatch,
                build_error_msg("Copied ", written, " chunks but ", info.value().chunks, " were expected"));
        }
        pack.close();

        if (remove_src) {
            std::filesystem::remove(src, ec);
            if (ec) {
                options.warn(0, "source_not_removed",
                             build_error_msg("Cannot remove '", src.string(), "': ", ec.message()));
            }
        }

        return count_result::success(written);
    }

    result<file_info> uncompress_file(const std::filesystem::path& src,
                                      const std::filesystem::path& dest,
                                      bool replace_dest,
                                      const pack_options& options) {
        std::error_code ec;
        if (!replace_dest && std::filesystem::exists(dest, ec)) {
            return result<file_info>::failure(error_kind::io_error,
                build_error_msg("Destination '", dest.string(), "' already exists"));
        }

        pack_stream pack(options);
        auto info = open_packed_file(pack, src);
        if (!info) {
            return info;
        }

        std::optional<error_info> error;
        {
            std::ofstream out(dest, std::ios::out | std::ios::trunc | std::ios::binary);
            if (!out.is_open()) {
                return result<file_info>::failure(error_kind::io_error,
                    build_error_msg("Cannot create destination file '", dest.string(), "'"));
            }

            error = stream_chunks(pack, info.value(), out, options);
            out.close();
            if (!error && out.fail()) {
                error = error_info{error_kind::io_error,
                    build_error_msg("Cannot finish writing '", dest.string(), "'")};
            }
        }
        pack.close();

        if (error) {
            std::filesystem::remove(dest, ec);
            if (ec) {
                options.warn(0, "partial_output",
                             build_error_msg("Cannot remove incomplete '", dest.string(), "': ", ec.message()));
            }
            return result<file_info>::failure(std::move(*error));
        }

        std::filesystem::last_write_time(dest, from_epoch_seconds(info.value().date), ec);
        if (ec) {
            options.warn(0, "mtime_not_restored",
                         build_error_msg("Cannot restore the modification time of '", dest.string(), "': ",
                                         ec.message()));
        }

        return info;
    }

    result<file_info> export_file(const std::filesystem::path& src,
                                  std::ostream& sink,
                                  const file_info_handler& on_file_info,
                                  const pack_options& options) {
        pack_stream pack(options);
        auto info = open_packed_file(pack, src);
        if (!info) {
            return info;
        }

        if (on_file_info) {
            on_file_info(info.value());
        }

        auto error = stream_chunks(pack, info.value(), sink, options);
        pack.close();
        if (error) {
            return result<file_info>::failure(std::move(*error));
        }
        return info;
    }

    result<file_info> read_file_info(const std::filesystem::path& src, const pack_options& options) {
        pack_stream pack(options);
        auto info = open_packed_file(pack, src);
        pack.close();
        return info;
    }

    std::vector<http_header> download_headers(const file_info& info) {
        std::vector<http_header> headers;
        headers.emplace_back("Content-type", info.mime);

        if (info.mime.find("image") != std::string::npos) {
            headers.emplace_back("Content-Disposition", "inline");
        } else {
            auto name = std::filesystem::path(info.file).filename().string();
            headers.emplace_back("Content-Disposition", "attachment; filename=" + name);
        }

        headers.emplace_back("Content-Length", std::to_string(info.size));
        headers.emplace_back("Pragma", "no-cache");
        headers.emplace_back("Expires", "0");
        return headers;
    }

} // namespace framepack
