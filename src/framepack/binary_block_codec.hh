//
// Binary (zlib) block framing.
//

#pragma once

#include <framepack/block_codec.hh>

namespace framepack {

    // [1 byte count][count little-endian length bytes][zlib stream]
    class binary_block_codec : public block_codec {
    public:
        explicit binary_block_codec(const pack_options& options);

        pack_mode mode() const override { return pack_mode::binary; }

        std::optional<std::vector<std::byte>> read(std::istream& is) const override;
        bool skip(std::istream& is) const override;

    protected:
        std::vector<std::byte> encode_frame(const void* data, std::size_t size) const override;

    private:
        // Reads the length prefix; nullopt at a clean end of the pack
        std::optional<std::uint64_t> read_length(std::istream& is) const;
    };

} // namespace framepack
