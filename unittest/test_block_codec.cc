//
// Tests for binary and text block framing
//

#include <doctest/doctest.h>
#include <framepack/block_codec.hh>
#include <framepack/exceptions.hh>
#include <limits>
#include <sstream>
#include "test_utils.hh"

using namespace framepack;
using namespace std::string_literals;

namespace {
    std::string frame_of(const block_codec& codec, std::string_view data) {
        auto frame = codec.encode(data.data(), data.size());
        return std::string(reinterpret_cast<const char*>(frame.data()), frame.size());
    }

    std::string read_back(const block_codec& codec, const std::string& frames) {
        std::istringstream is(frames);
        auto block = codec.read(is);
        REQUIRE(block.has_value());
        return to_string(*block);
    }
}

TEST_CASE("block_codec factory") {
    CHECK(block_codec::create(pack_mode::binary)->mode() == pack_mode::binary);
    CHECK(block_codec::create(pack_mode::text)->mode() == pack_mode::text);
}

TEST_CASE("binary blocks") {
    auto codec = block_codec::create(pack_mode::binary);

    SUBCASE("frame layout") {
        auto frame = frame_of(*codec, "hello hello hello hello");
        REQUIRE(frame.size() > 2);
        auto count = static_cast<unsigned char>(frame[0]);
        REQUIRE(count >= 1);
        REQUIRE(count <= 7);

        std::uint64_t length = 0;
        for (unsigned i = 0; i < count; i++) {
            length |= std::uint64_t(static_cast<unsigned char>(frame[1 + i])) << (8 * i);
        }
        CHECK(length == frame.size() - 1 - count);
        // zlib stream header
        CHECK(static_cast<unsigned char>(frame[1 + count]) == 0x78);
    }

    SUBCASE("payloads survive encoding") {
        for (const auto& data : {""s, "a"s, "first block"s, make_payload(5000), std::string(100000, 'z')}) {
            CAPTURE(data.size());
            CHECK(read_back(*codec, frame_of(*codec, data)) == data);
        }
    }

    SUBCASE("large block uses the fast level and still decodes") {
        auto data = make_payload(1536 * 1024, 7);
        CHECK(read_back(*codec, frame_of(*codec, data)) == data);
    }

    SUBCASE("clean end") {
        std::istringstream is("");
        CHECK_FALSE(codec->read(is).has_value());
        std::istringstream again("");
        CHECK_FALSE(codec->skip(again));
    }

    SUBCASE("skip then read") {
        auto frames = frame_of(*codec, "one") + frame_of(*codec, "two");
        std::istringstream is(frames);
        CHECK(codec->skip(is));
        auto block = codec->read(is);
        REQUIRE(block.has_value());
        CHECK(to_string(*block) == "two");
        CHECK_FALSE(codec->read(is).has_value());
    }

    SUBCASE("zero length prefix size") {
        std::istringstream is("\x00\x05"s);
        try {
            codec->read(is);
            FAIL("Should have thrown exception");
        } catch (const format_error& e) {
            CHECK(e.kind() == error_kind::corrupt_block);
        }
    }

    SUBCASE("length prefix size above seven") {
        std::istringstream is("\x09\x01\x00\x00\x00\x00\x00\x00\x00\x00"s);
        CHECK_THROWS_AS(codec->read(is), format_error);
    }

    SUBCASE("damaged zlib stream") {
        auto frame = frame_of(*codec, make_payload(300));
        frame[frame.size() / 2] = static_cast<char>(frame[frame.size() / 2] ^ 0x55);
        frame[frame.size() - 1] = static_cast<char>(frame[frame.size() - 1] ^ 0x55);
        std::istringstream is(frame);
        try {
            codec->read(is);
            FAIL("Should have thrown exception");
        } catch (const pack_error& e) {
            CHECK(e.kind() == error_kind::corrupt_block);
        }
    }

    SUBCASE("truncated payload") {
        auto frame = frame_of(*codec, make_payload(300));
        std::istringstream is(frame.substr(0, frame.size() - 20));
        try {
            codec->read(is);
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            CHECK(e.kind() == error_kind::unexpected_eof);
        }
    }

    SUBCASE("truncated length prefix") {
        std::istringstream is("\x03\x10"s);
        try {
            codec->read(is);
            FAIL("Should have thrown exception");
        } catch (const pack_error& e) {
            CHECK(e.kind() == error_kind::unexpected_eof);
        }
    }
}

TEST_CASE("text blocks") {
    auto codec = block_codec::create(pack_mode::text);

    SUBCASE("frame layout") {
        CHECK(frame_of(*codec, "Hello, world!") == "\n#12:5360fe6aafc4a86992fb8eed9fe1cba6\nSGVsbG8sIHdvcmxkIQ");
    }

    SUBCASE("empty block") {
        auto frame = frame_of(*codec, "");
        CHECK(frame == "\n#0:d41d8cd98f00b204e9800998ecf8427e\n");
        CHECK(read_back(*codec, frame).empty());
    }

    SUBCASE("lines are wrapped at 1024 columns") {
        auto frame = frame_of(*codec, make_payload(3000));
        auto body_start = frame.find('\n', 1) + 1;
        std::string body = frame.substr(body_start);

        // 3000 bytes -> 4000 base64 characters -> 4 lines
        CHECK(body.size() == 4003);
        CHECK(body.find('=') == std::string::npos);
        CHECK(body[1024] == '\n');
        CHECK(body[2049] == '\n');
        CHECK(body[3074] == '\n');
        CHECK(body.back() != '\n');
        CHECK(frame.substr(0, 6) == "\n#fa3:");
    }

    SUBCASE("payloads survive encoding") {
        for (const auto& data : {"a"s, "ab"s, "abc"s, make_payload(1023), make_payload(4096)}) {
            CAPTURE(data.size());
            CHECK(read_back(*codec, frame_of(*codec, data)) == data);
        }
    }

    SUBCASE("carriage returns are tolerated") {
        CHECK(read_back(*codec, "\r\n#12:5360fe6aafc4a86992fb8eed9fe1cba6\r\nSGVsbG8sIHdvcmxkIQ") == "Hello, world!");
    }

    SUBCASE("tampered payload") {
        auto is = load_test("text_tampered.pack");
        REQUIRE(is->good());
        is->seekg(static_cast<std::streamoff>(pack_header_size));
        try {
            codec->read(*is);
            FAIL("Should have thrown exception");
        } catch (const format_error& e) {
            CHECK(e.kind() == error_kind::checksum_mismatch);
        }
    }

    SUBCASE("missing separator line") {
        std::istringstream is("#12:5360fe6aafc4a86992fb8eed9fe1cba6\nSGVsbG8sIHdvcmxkIQ");
        try {
            codec->read(is);
            FAIL("Should have thrown exception");
        } catch (const format_error& e) {
            CHECK(e.kind() == error_kind::corrupt_block);
        }
    }

    SUBCASE("malformed header line") {
        std::istringstream short_line("\n#12:5360fe\nSGVsbG8sIHdvcmxkIQ");
        CHECK_THROWS_AS(codec->read(short_line), format_error);

        std::istringstream bad_hex("\n#zz:5360fe6aafc4a86992fb8eed9fe1cba6\nSGVsbG8sIHdvcmxkIQ");
        CHECK_THROWS_AS(codec->read(bad_hex), format_error);
    }

    SUBCASE("declared length past the end") {
        std::istringstream is("\n#ff:5360fe6aafc4a86992fb8eed9fe1cba6\nSGVsbG8sIHdvcmxkIQ");
        try {
            codec->read(is);
            FAIL("Should have thrown exception");
        } catch (const io_error& e) {
            CHECK(e.kind() == error_kind::unexpected_eof);
        }
    }

    SUBCASE("header line at the end of the pack") {
        for (const auto& frame : {"\n#5:d41d8cd98f00b204e9800998ecf8427e"s,
                                  "\n#0:d41d8cd98f00b204e9800998ecf8427e"s,
                                  "\n"s}) {
            CAPTURE(frame);
            std::istringstream is(frame);
            try {
                codec->read(is);
                FAIL("Should have thrown exception");
            } catch (const io_error& e) {
                CHECK(e.kind() == error_kind::unexpected_eof);
            }
        }
    }

    SUBCASE("skip does not verify the digest") {
        std::string frames = "\n#12:00000000000000000000000000000000\nSGVsbG8sIHdvcmxkIQ" + frame_of(*codec, "next");
        std::istringstream is(frames);
        CHECK(codec->skip(is));
        auto block = codec->read(is);
        REQUIRE(block.has_value());
        CHECK(to_string(*block) == "next");
    }
}

TEST_CASE("block size limit") {
    pack_options options;
    options.chunk_size = 16;

    for (auto mode : {pack_mode::binary, pack_mode::text}) {
        CAPTURE(mode_name(mode));
        auto codec = block_codec::create(mode, options);

        std::string at_limit(16, 'x');
        CHECK_NOTHROW((void)codec->encode(at_limit.data(), at_limit.size()));

        std::string over(17, 'x');
        try {
            (void)codec->encode(over.data(), over.size());
            FAIL("Should have thrown exception");
        } catch (const limit_error& e) {
            CHECK(e.kind() == error_kind::block_too_large);
        }

        std::ostringstream os;
        CHECK_THROWS_AS(codec->write(os, over.data(), over.size()), limit_error);
        CHECK(os.str().empty());
    }

    SUBCASE("zero chunk size disables the limit") {
        options.chunk_size = 0;
        auto codec = block_codec::create(pack_mode::binary, options);
        auto data = make_payload(4096);
        CHECK_NOTHROW((void)codec->encode(data.data(), data.size()));
    }
}

TEST_CASE("decoded size limit") {
    pack_options unlimited;
    unlimited.chunk_size = 0;

    pack_options limited;
    limited.chunk_size = 1024 * 1024;

    SUBCASE("limit follows the chunk size") {
        CHECK(block_codec::create(pack_mode::binary)->decode_limit() == 10485760);
        CHECK(block_codec::create(pack_mode::binary, limited)->decode_limit() == 1024 * 1024);
        CHECK(block_codec::create(pack_mode::binary, unlimited)->decode_limit() ==
              std::numeric_limits<std::size_t>::max());

        pack_options tiny;
        tiny.chunk_size = 16;
        CHECK(block_codec::create(pack_mode::text, tiny)->decode_limit() == block_codec::min_decode_limit);
    }

    SUBCASE("highly compressible binary block") {
        // 4 MiB of zeros compress to a few kilobytes
        std::string zeros(4 * 1024 * 1024, '\0');
        auto frame = frame_of(*block_codec::create(pack_mode::binary, unlimited), zeros);
        CHECK(frame.size() < 64 * 1024);

        std::istringstream is(frame);
        try {
            block_codec::create(pack_mode::binary, limited)->read(is);
            FAIL("Should have thrown exception");
        } catch (const format_error& e) {
            CHECK(e.kind() == error_kind::corrupt_block);
        }

        CHECK(read_back(*block_codec::create(pack_mode::binary, unlimited), frame) == zeros);
    }

    SUBCASE("text block above the limit") {
        pack_options small;
        small.chunk_size = 1024;
        auto data = make_payload(block_codec::min_decode_limit + 1);
        auto frame = frame_of(*block_codec::create(pack_mode::text, unlimited), data);

        std::istringstream is(frame);
        CHECK_THROWS_AS(block_codec::create(pack_mode::text, small)->read(is), format_error);

        auto at_limit = make_payload(block_codec::min_decode_limit);
        CHECK(read_back(*block_codec::create(pack_mode::text, small),
                        frame_of(*block_codec::create(pack_mode::text, unlimited), at_limit)) == at_limit);
    }
}
