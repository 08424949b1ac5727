//
// Binary (zlib) block framing.
//

#include <istream>

#include <framepack/length_codec.hh>
#include <framepack/exceptions.hh>
#include "binary_block_codec.hh"
#include "deflate.hh"
#include "input.hh"

namespace framepack {

    binary_block_codec::binary_block_codec(const pack_options& options)
        : block_codec(options) {
    }

    std::vector<std::byte> binary_block_codec::encode_frame(const void* data, std::size_t size) const {
        auto compressed = deflate::compress(data, size, deflate::level_for(size));

        // A zlib stream is never empty, so the prefix always has at least one byte
        auto length = encode_length(compressed.size());

        std::vector<std::byte> frame;
        frame.reserve(1 + length.size() + compressed.size());
        frame.push_back(static_cast<std::byte>(length.size()));
        for (auto b : length) {
            frame.push_back(static_cast<std::byte>(b));
        }
        frame.insert(frame.end(), compressed.begin(), compressed.end());
        return frame;
    }

    std::optional<std::uint64_t> binary_block_codec::read_length(std::istream& is) const {
        reader r(is);
        if (r.at_end()) {
            return std::nullopt;
        }

        std::uint64_t offset = r.tell();
        std::uint8_t count = 0;
        std::size_t actual = r.read(&count, 1);
        if (actual == 0) {
            return std::nullopt;
        }

        THROW_FORMAT_IF(count == 0 || count > max_length_bytes, corrupt_block,
                        "Invalid length prefix size ", static_cast<unsigned>(count), " in block at offset ", offset);

        auto prefix = r.read_exact(count, "block length");
        std::uint64_t length = decode_length(reinterpret_cast<const std::uint8_t*>(prefix.data()), prefix.size());
        THROW_FORMAT_IF(length == 0, corrupt_block, "Zero length block at offset ", offset);

        return length;
    }

    std::optional<std::vector<std::byte>> binary_block_codec::read(std::istream& is) const {
        auto length = read_length(is);
        if (!length) {
            return std::nullopt;
        }

        reader r(is);
        r.ensure_available(*length, "block payload");
        auto payload = r.read_exact(static_cast<std::size_t>(*length), "block payload");

        return deflate::uncompress(payload.data(), payload.size(), decode_limit());
    }

    bool binary_block_codec::skip(std::istream& is) const {
        auto length = read_length(is);
        if (!length) {
            return false;
        }

        reader r(is);
        r.skip(*length);
        return true;
    }

} // namespace framepack
