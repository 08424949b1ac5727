//
// Text (base64) block framing.
//

#include <istream>
#include <algorithm>

#include <framepack/length_codec.hh>
#include <framepack/exceptions.hh>
#include "text_block_codec.hh"
#include "text_encoding.hh"
#include "input.hh"

namespace framepack {

    static constexpr char line_terminator = '\n';

    // At most 14 hex digits, i.e. the same 7 byte budget as binary lengths
    static constexpr std::size_t max_hex_digits = 2 * max_length_bytes;

    static std::string to_hex(std::uint64_t value) {
        static constexpr char hex[] = "0123456789abcdef";
        if (value == 0) {
            return "0";
        }
        std::string out;
        while (value > 0) {
            out.push_back(hex[value & 0x0F]);
            value >>= 4;
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

    static std::optional<std::uint64_t> parse_hex(std::string_view text) {
        if (text.empty() || text.size() > max_hex_digits) {
            return std::nullopt;
        }
        std::uint64_t value = 0;
        for (char c : text) {
            int digit;
            if (c >= '0' && c <= '9') {
                digit = c - '0';
            } else if (c >= 'a' && c <= 'f') {
                digit = c - 'a' + 10;
            } else if (c >= 'A' && c <= 'F') {
                digit = c - 'A' + 10;
            } else {
                return std::nullopt;
            }
            value = (value << 4) | static_cast<std::uint64_t>(digit);
        }
        return value;
    }

    text_block_codec::text_block_codec(const pack_options& options)
        : block_codec(options) {
    }

    std::vector<std::byte> text_block_codec::encode_frame(const void* data, std::size_t size) const {
        std::string encoded = text_encoding::base64_encode(data, size);
        while (!encoded.empty() && encoded.back() == '=') {
            encoded.pop_back();
        }

        std::string payload;
        payload.reserve(encoded.size() + encoded.size() / text_line_width + 1);
        for (std::size_t pos = 0; pos < encoded.size(); pos += text_line_width) {
            if (pos > 0) {
                payload += line_terminator;
            }
            payload.append(encoded, pos, text_line_width);
        }

        // Validates the length against the same budget binary blocks have
        encode_length(payload.size());

        std::string head;
        head += line_terminator;
        head += '#';
        head += to_hex(payload.size());
        head += ':';
        head += text_encoding::md5_hex(payload.data(), payload.size());
        head += line_terminator;

        std::vector<std::byte> frame;
        frame.reserve(head.size() + payload.size());
        const auto* h = reinterpret_cast<const std::byte*>(head.data());
        const auto* p = reinterpret_cast<const std::byte*>(payload.data());
        frame.insert(frame.end(), h, h + head.size());
        frame.insert(frame.end(), p, p + payload.size());
        return frame;
    }

    std::optional<text_block_codec::block_line> text_block_codec::read_block_line(std::istream& is) const {
        reader r(is);
        if (r.at_end()) {
            return std::nullopt;
        }

        std::uint64_t offset = r.tell();
        auto separator = r.read_line();
        if (!separator) {
            return std::nullopt;
        }
        THROW_FORMAT_UNLESS(separator->empty(), corrupt_block,
                            "Expected a line break before the block at offset ", offset);

        auto line = r.read_line();
        THROW_EOF_IF(!line, "Unexpected end of pack reading the header line of the block at offset ", offset);

        // The payload follows the line break; without one the block is cut short
        THROW_EOF_IF(r.get_stream().eof(), "Unexpected end of pack after the header line of the block at offset ",
                     offset);
        THROW_FORMAT_IF(line->size() < min_header_line || (*line)[0] != '#', corrupt_block,
                        "Malformed block header line at offset ", offset);

        auto colon = line->find(':');
        THROW_FORMAT_IF(colon == std::string::npos, corrupt_block,
                        "Block header line at offset ", offset, " has no digest separator");

        auto length = parse_hex(std::string_view(*line).substr(1, colon - 1));
        THROW_FORMAT_UNLESS(length, corrupt_block,
                            "Block header line at offset ", offset, " has an invalid length");

        return block_line{*length, line->substr(colon + 1), offset};
    }

    std::optional<std::vector<std::byte>> text_block_codec::read(std::istream& is) const {
        auto block = read_block_line(is);
        if (!block) {
            return std::nullopt;
        }

        reader r(is);
        r.ensure_available(block->length, "block payload");
        auto payload = r.read_exact(static_cast<std::size_t>(block->length), "block payload");

        std::string digest = text_encoding::md5_hex(payload.data(), payload.size());
        THROW_FORMAT_IF(digest != block->digest, checksum_mismatch,
                        "Checksum mismatch in block at offset ", block->offset,
                        ": stored ", block->digest, ", computed ", digest);

        std::string encoded;
        encoded.reserve(payload.size());
        for (auto b : payload) {
            char c = static_cast<char>(b);
            if (c != '\n' && c != '\r') {
                encoded.push_back(c);
            }
        }

        auto decoded = text_encoding::base64_decode(encoded);
        THROW_FORMAT_IF(decoded.size() > decode_limit(), corrupt_block,
                        "Block at offset ", block->offset, " decodes to ", decoded.size(),
                        " bytes, more than the limit of ", decode_limit());
        return decoded;
    }

    bool text_block_codec::skip(std::istream& is) const {
        auto block = read_block_line(is);
        if (!block) {
            return false;
        }

        reader r(is);
        r.skip(block->length);
        return true;
    }

} // namespace framepack
