//
// Block codec factory and size policy.
//

#include <algorithm>
#include <limits>
#include <ostream>

#include <framepack/block_codec.hh>
#include <framepack/exceptions.hh>
#include "binary_block_codec.hh"
#include "text_block_codec.hh"
#include "input.hh"

namespace framepack {

    std::unique_ptr<block_codec> block_codec::create(pack_mode mode) {
        // Use default options
        pack_options default_opts;
        return create(mode, default_opts);
    }

    std::unique_ptr<block_codec> block_codec::create(pack_mode mode, const pack_options& options) {
        switch (mode) {
            case pack_mode::binary:
                return std::make_unique<binary_block_codec>(options);
            case pack_mode::text:
                return std::make_unique<text_block_codec>(options);
        }
        THROW_LIMIT(invalid_argument, "Unknown pack mode ", static_cast<int>(mode));
    }

    std::vector<std::byte> block_codec::encode(const void* data, std::size_t size) const {
        THROW_LIMIT_IF(m_options.chunk_size > 0 && size > m_options.chunk_size, block_too_large,
                       "Block of ", size, " bytes is larger than the chunk size of ", m_options.chunk_size,
                       " bytes; pack it as a file instead");

        return encode_frame(data, size);
    }

    std::size_t block_codec::decode_limit() const {
        if (m_options.chunk_size == 0 || m_options.chunk_size >= std::numeric_limits<std::size_t>::max()) {
            return std::numeric_limits<std::size_t>::max();
        }
        return std::max(static_cast<std::size_t>(m_options.chunk_size), min_decode_limit);
    }

    void block_codec::write(std::ostream& os, const void* data, std::size_t size) const {
        auto frame = encode(data, size);

        writer w(os);
        w.write(frame.data(), frame.size());
    }

} // namespace framepack
