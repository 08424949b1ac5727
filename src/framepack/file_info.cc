//
// FileInfo record: serialization, parsing and description of source files.
//

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>
#include <optional>
#include <system_error>

#include <framepack/file_info.hh>
#include <framepack/exceptions.hh>
#include "mime.hh"

namespace framepack {

    namespace {

        void append_string(std::string& out, std::string_view value) {
            out += "s:";
            out += std::to_string(value.size());
            out += ":\"";
            out += value;
            out += "\";";
        }

        template<typename T>
        void append_integer(std::string& out, T value) {
            out += "i:";
            out += std::to_string(value);
            out += ';';
        }

        // Scalar value of the serialized array; only what the record uses
        struct scalar {
            enum class type { string, integer, number, boolean, null } kind;
            std::string text;
            std::int64_t integer = 0;
            double number = 0;
        };

        // Cursor over PHP serialize() output, throws corrupt_metadata
        class unserializer {
        public:
            explicit unserializer(std::string_view text) : m_text(text) {}

            std::map<std::string, scalar> read_array() {
                expect('a');
                expect(':');
                std::int64_t count = read_integer_until(':');
                expect('{');

                std::map<std::string, scalar> values;
                for (std::int64_t i = 0; i < count; i++) {
                    scalar key = read_scalar();
                    std::string name;
                    if (key.kind == scalar::type::string) {
                        name = key.text;
                    } else if (key.kind == scalar::type::integer) {
                        name = std::to_string(key.integer);
                    } else {
                        THROW_FORMAT(corrupt_metadata, "Unsupported array key at position ", m_pos);
                    }
                    values[name] = read_scalar();
                }

                expect('}');
                THROW_FORMAT_UNLESS(m_pos == m_text.size(), corrupt_metadata,
                                    "Unexpected data after the metadata record");
                return values;
            }

        private:
            scalar read_scalar() {
                THROW_FORMAT_IF(m_pos >= m_text.size(), corrupt_metadata, "Metadata record is truncated");

                scalar value{};
                char tag = m_text[m_pos++];
                switch (tag) {
                    case 's': {
                        expect(':');
                        std::int64_t length = read_integer_until(':');
                        THROW_FORMAT_IF(length < 0 || static_cast<std::uint64_t>(length) + 2 > m_text.size() - m_pos,
                                        corrupt_metadata, "String length ", length, " runs past the metadata record");
                        expect('"');
                        value.kind = scalar::type::string;
                        value.text = std::string(m_text.substr(m_pos, static_cast<std::size_t>(length)));
                        m_pos += static_cast<std::size_t>(length);
                        expect('"');
                        expect(';');
                        break;
                    }
                    case 'i':
                        expect(':');
                        value.kind = scalar::type::integer;
                        value.integer = read_integer_until(';');
                        break;
                    case 'd': {
                        expect(':');
                        auto token = read_token(';');
                        value.kind = scalar::type::number;
                        std::string copy(token);
                        char* end = nullptr;
                        value.number = std::strtod(copy.c_str(), &end);
                        THROW_FORMAT_IF(copy.empty() || end != copy.c_str() + copy.size(), corrupt_metadata,
                                        "Invalid number '", copy, "' in metadata record");
                        break;
                    }
                    case 'b':
                        expect(':');
                        value.kind = scalar::type::boolean;
                        value.integer = read_integer_until(';');
                        break;
                    case 'N':
                        expect(';');
                        value.kind = scalar::type::null;
                        break;
                    default:
                        THROW_FORMAT(corrupt_metadata, "Unsupported value type '", tag, "' in metadata record");
                }
                return value;
            }

            std::string_view read_token(char terminator) {
                auto end = m_text.find(terminator, m_pos);
                THROW_FORMAT_IF(end == std::string_view::npos, corrupt_metadata, "Metadata record is truncated");
                auto token = m_text.substr(m_pos, end - m_pos);
                m_pos = end + 1;
                return token;
            }

            std::int64_t read_integer_until(char terminator) {
                auto token = read_token(terminator);
                std::int64_t value = 0;
                auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
                THROW_FORMAT_IF(ec != std::errc() || ptr != token.data() + token.size() || token.empty(),
                                corrupt_metadata, "Invalid integer '", token, "' in metadata record");
                return value;
            }

            void expect(char c) {
                THROW_FORMAT_IF(m_pos >= m_text.size() || m_text[m_pos] != c, corrupt_metadata,
                                "Expected '", c, "' at position ", m_pos, " of the metadata record");
                m_pos++;
            }

            std::string_view m_text;
            std::size_t m_pos = 0;
        };

        std::optional<std::int64_t> integral_value(const scalar& value) {
            if (value.kind == scalar::type::integer) {
                return value.integer;
            }
            if (value.kind == scalar::type::number) {
                double whole = 0;
                if (std::modf(value.number, &whole) != 0.0 || !std::isfinite(value.number)
                    || std::fabs(whole) >= 9.2e18) {
                    return std::nullopt;
                }
                return static_cast<std::int64_t>(whole);
            }
            return std::nullopt;
        }

        const scalar& require(const std::map<std::string, scalar>& values, const char* key) {
            auto it = values.find(key);
            THROW_FORMAT_IF(it == values.end(), corrupt_metadata, "Metadata record has no '", key, "' entry");
            return it->second;
        }

        std::string require_string(const std::map<std::string, scalar>& values, const char* key) {
            const auto& value = require(values, key);
            THROW_FORMAT_IF(value.kind != scalar::type::string || value.text.empty(), corrupt_metadata,
                            "Metadata entry '", key, "' must be a non-empty string");
            return value.text;
        }

        std::int64_t require_integer(const std::map<std::string, scalar>& values, const char* key) {
            auto value = integral_value(require(values, key));
            THROW_FORMAT_UNLESS(value, corrupt_metadata, "Metadata entry '", key, "' must be an integer");
            return *value;
        }
    }

    std::string serialize(const file_info& info) {
        std::string out = "a:5:{";
        append_string(out, "file");
        append_string(out, info.file);
        append_string(out, "date");
        append_integer(out, info.date);
        append_string(out, "size");
        append_integer(out, info.size);
        append_string(out, "mime");
        append_string(out, info.mime);
        append_string(out, "chks");
        append_integer(out, info.chunks);
        out += '}';
        return out;
    }

    result<file_info> parse_file_info(std::string_view text) {
        try {
            auto values = unserializer(text).read_array();

            file_info info;
            info.file = require_string(values, "file");
            info.mime = require_string(values, "mime");

            info.date = require_integer(values, "date");
            THROW_FORMAT_IF(info.date <= 0, corrupt_metadata, "Metadata date ", info.date, " is not positive");

            auto size = require_integer(values, "size");
            THROW_FORMAT_IF(size < 0, corrupt_metadata, "Metadata size ", size, " is negative");
            info.size = static_cast<std::uint64_t>(size);

            auto chunks = require_integer(values, "chks");
            THROW_FORMAT_IF(chunks <= 0, corrupt_metadata, "Metadata chunk count ", chunks, " is not positive");
            info.chunks = static_cast<std::uint64_t>(chunks);

            return result<file_info>::success(std::move(info));
        } catch (const pack_error& e) {
            return result<file_info>::failure(to_error_info(e));
        }
    }

    result<file_info> describe_file(const std::filesystem::path& path, std::uint64_t chunk_size,
                                    const pack_options& options) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return result<file_info>::failure(error_kind::io_error,
                build_error_msg("'", path.string(), "' is not a regular file"));
        }

        file_info info;
        info.file = path.filename().string();

        info.size = std::filesystem::file_size(path, ec);
        if (ec) {
            return result<file_info>::failure(error_kind::io_error,
                build_error_msg("Cannot get the size of '", path.string(), "': ", ec.message()));
        }

        auto mtime = std::filesystem::last_write_time(path, ec);
        if (ec) {
            return result<file_info>::failure(error_kind::io_error,
                build_error_msg("Cannot get the modification time of '", path.string(), "': ", ec.message()));
        }
        info.date = to_epoch_seconds(mtime);

        if (auto type = mime::detect(path)) {
            info.mime = *type;
        } else {
            info.mime = mime::fallback_type;
            options.warn(0, "mime_fallback",
                         build_error_msg("Cannot detect the MIME type of '", path.string(), "', using ", info.mime));
        }

        info.chunks = chunk_count(info.size, chunk_size);
        return result<file_info>::success(std::move(info));
    }

    std::int64_t to_epoch_seconds(std::filesystem::file_time_type time) {
        auto system_time = std::chrono::file_clock::to_sys(time);
        return std::chrono::floor<std::chrono::seconds>(system_time).time_since_epoch().count();
    }

    std::filesystem::file_time_type from_epoch_seconds(std::int64_t seconds) {
        std::chrono::sys_seconds system_time{std::chrono::seconds(seconds)};
        return std::chrono::file_clock::from_sys(system_time);
    }

} // namespace framepack
