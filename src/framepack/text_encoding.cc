//
// OpenSSL backed base64 and MD5 helpers for text blocks.
//

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <cstdint>

#include <framepack/exceptions.hh>
#include "text_encoding.hh"

namespace framepack::text_encoding {

    namespace {
        struct md_ctx_deleter {
            void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
        };
        using unique_md_ctx = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

        // EVP_EncodeBlock/EVP_DecodeBlock take int lengths, so large inputs go in pieces
        constexpr std::size_t encode_piece = 3 * (1u << 20);
        constexpr std::size_t decode_piece = 4 * (1u << 20);

        std::string hex_encode(const unsigned char* data, std::size_t size) {
            static constexpr char hex[] = "0123456789abcdef";
            std::string out;
            out.reserve(size * 2);
            for (std::size_t i = 0; i < size; i++) {
                out.push_back(hex[(data[i] >> 4) & 0x0F]);
                out.push_back(hex[data[i] & 0x0F]);
            }
            return out;
        }
    }

    std::string base64_encode(const void* data, std::size_t size) {
        std::string out;
        out.reserve(4 * ((size + 2) / 3));

        const auto* src = static_cast<const unsigned char*>(data);
        std::vector<unsigned char> buffer(4 * (encode_piece / 3) + 1);

        for (std::size_t offset = 0; offset < size; offset += encode_piece) {
            std::size_t piece = std::min(encode_piece, size - offset);
            int written = EVP_EncodeBlock(buffer.data(), src + offset, static_cast<int>(piece));
            THROW_IO_IF(written < 0, "base64 encoding failed");
            out.append(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(written));
        }

        return out;
    }

    std::vector<std::byte> base64_decode(std::string_view encoded) {
        // The stored form has no padding; restore it so OpenSSL sees full quads
        std::string padded(encoded);
        while (!padded.empty() && padded.back() == '=') {
            padded.pop_back();
        }
        THROW_FORMAT_IF(padded.size() % 4 == 1, corrupt_block,
                        "Invalid base64 payload length ", padded.size());
        std::size_t padding = (4 - padded.size() % 4) % 4;
        padded.append(padding, '=');

        std::vector<std::byte> out;
        out.reserve(3 * (padded.size() / 4));
        std::vector<unsigned char> buffer(3 * (decode_piece / 4));

        for (std::size_t offset = 0; offset < padded.size(); offset += decode_piece) {
            std::size_t piece = std::min(decode_piece, padded.size() - offset);
            int written = EVP_DecodeBlock(buffer.data(),
                                          reinterpret_cast<const unsigned char*>(padded.data() + offset),
                                          static_cast<int>(piece));
            THROW_FORMAT_IF(written < 0, corrupt_block, "Invalid base64 payload");
            const auto* first = reinterpret_cast<const std::byte*>(buffer.data());
            out.insert(out.end(), first, first + written);
        }

        // EVP_DecodeBlock emits zero bytes for the padding characters
        out.resize(out.size() - padding);
        return out;
    }

    std::string md5_hex(const void* data, std::size_t size) {
        unique_md_ctx ctx(EVP_MD_CTX_new());
        THROW_IO_UNLESS(ctx, "Digest context allocation failed");

        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int digest_len = 0;

        THROW_IO_IF(EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1, "Digest init failed");
        if (size > 0) {
            THROW_IO_IF(EVP_DigestUpdate(ctx.get(), data, size) != 1, "Digest update failed");
        }
        THROW_IO_IF(EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1, "Digest final failed");

        return hex_encode(digest.data(), digest_len);
    }
}
