//
// Text (base64) block framing.
//

#pragma once

#include <string>
#include <framepack/block_codec.hh>

namespace framepack {

    // "\n#<hex length>:<md5 of payload>\n" followed by unpadded base64 wrapped at 1024 columns
    class text_block_codec : public block_codec {
    public:
        /// '#' + at least one hex digit + ':' + 32 digest characters
        static constexpr std::size_t min_header_line = 35;

        explicit text_block_codec(const pack_options& options);

        pack_mode mode() const override { return pack_mode::text; }

        std::optional<std::vector<std::byte>> read(std::istream& is) const override;
        bool skip(std::istream& is) const override;

    protected:
        std::vector<std::byte> encode_frame(const void* data, std::size_t size) const override;

    private:
        struct block_line {
            std::uint64_t length;
            std::string digest;
            std::uint64_t offset;
        };

        // Reads separator and header line; nullopt at a clean end of the pack
        std::optional<block_line> read_block_line(std::istream& is) const;
    };

} // namespace framepack
