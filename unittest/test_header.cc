//
// Tests for pack header reading and writing
//

#include <doctest/doctest.h>
#include <framepack/header.hh>
#include <framepack/exceptions.hh>
#include <sstream>
#include "test_utils.hh"

using namespace framepack;

TEST_CASE("write_header") {
    SUBCASE("binary") {
        std::ostringstream os;
        write_header(os, pack_mode::binary);
        CHECK(os.str() == "MIFRAMEPACK/1.0/B");
    }

    SUBCASE("text") {
        std::ostringstream os;
        write_header(os, pack_mode::text);
        CHECK(os.str() == "MIFRAMEPACK/1.0/T");
        CHECK(os.str().size() == pack_header_size);
    }
}

TEST_CASE("read_header") {
    SUBCASE("adopts the stored mode") {
        std::istringstream binary("MIFRAMEPACK/1.0/B");
        CHECK(read_header(binary, std::nullopt) == pack_mode::binary);

        std::istringstream text("MIFRAMEPACK/1.0/Tmore data");
        CHECK(read_header(text, std::nullopt) == pack_mode::text);
        CHECK(text.tellg() == std::streampos(pack_header_size));
    }

    SUBCASE("matching expected mode") {
        std::istringstream is("MIFRAMEPACK/1.0/T");
        CHECK(read_header(is, pack_mode::text) == pack_mode::text);
    }

    SUBCASE("mode conflict") {
        std::istringstream is("MIFRAMEPACK/1.0/T");
        try {
            read_header(is, pack_mode::binary);
            FAIL("Should have thrown exception");
        } catch (const format_error& e) {
            CHECK(e.kind() == error_kind::header_mismatch);
            std::string msg = e.what();
            CHECK(msg.find("text") != std::string::npos);
            CHECK(msg.find("binary") != std::string::npos);
        }
    }

    SUBCASE("wrong version") {
        auto is = load_test("wrong_version.pack");
        REQUIRE(is->good());
        CHECK_THROWS_AS(read_header(*is, std::nullopt), format_error);
    }

    SUBCASE("unknown mode character") {
        auto is = load_test("unknown_mode.pack");
        REQUIRE(is->good());
        CHECK_THROWS_AS(read_header(*is, std::nullopt), format_error);
    }

    SUBCASE("short input") {
        std::istringstream is("MIFRAME");
        try {
            read_header(is, std::nullopt);
            FAIL("Should have thrown exception");
        } catch (const pack_error& e) {
            CHECK(e.kind() == error_kind::header_mismatch);
        }
    }

    SUBCASE("empty input") {
        std::istringstream is("");
        CHECK_THROWS_AS(read_header(is, std::nullopt), format_error);
    }
}

TEST_CASE("mode helpers") {
    CHECK(mode_char(pack_mode::binary) == 'B');
    CHECK(mode_char(pack_mode::text) == 'T');
    CHECK(mode_name(pack_mode::binary) == "binary");
    CHECK(mode_name(pack_mode::text) == "text");
}
