#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>

#include <string>
#include <vector>
#include "test_utils.hh"

using namespace pngchunk;

namespace {
    const std::string secret = "This is where your secret message will be!";
    constexpr std::uint32_t secret_crc = 2882656334u;

    std::vector<std::byte> secret_chunk_bytes() {
        return raw_chunk(42, "RuSt", secret, secret_crc);
    }
}

TEST_SUITE("CHUNK") {
    TEST_CASE("chunk construction") {
        SUBCASE("length and crc") {
            chunk c(chunk_type::from_name("RuSt"), bytes_of(secret));
            CHECK(c.length() == 42);
            CHECK(c.crc() == secret_crc);
            CHECK(c.type().to_string() == "RuSt");
            CHECK(c.data() == bytes_of(secret));
        }

        SUBCASE("text overload") {
            chunk c(chunk_type::from_name("RuSt"), secret);
            CHECK(c.crc() == secret_crc);
            CHECK(c.data_as_string() == secret);
        }

        SUBCASE("empty data") {
            chunk c(chunk_id::IEND, std::vector<std::byte>{});
            CHECK(c.length() == 0);
            CHECK(c.crc() == 0xAE426082u);
            CHECK(c.data_as_string().empty());
        }

        SUBCASE("crc is deterministic") {
            chunk a(chunk_type::from_name("TeSt"), std::string_view("first"));
            chunk b(chunk_type::from_name("TeSt"), std::string_view("first"));
            CHECK(a.crc() == b.crc());
            CHECK(a.crc() == 2271285180u);
            CHECK(a == b);
        }

        SUBCASE("crc covers the type") {
            chunk a(chunk_type::from_name("TeSt"), std::string_view("x"));
            chunk b(chunk_type::from_name("TeST"), std::string_view("x"));
            CHECK(a.crc() != b.crc());
            CHECK(a != b);
        }

        SUBCASE("crc helper") {
            auto data = bytes_of(secret);
            CHECK(chunk_crc(chunk_type::from_name("RuSt"), data.data(), data.size()) == secret_crc);
        }
    }

    TEST_CASE("chunk decode") {
        SUBCASE("valid chunk") {
            auto bytes = secret_chunk_bytes();
            auto c = chunk::decode(bytes);
            CHECK(c.length() == 42);
            CHECK(c.crc() == secret_crc);
            CHECK(c.type() == chunk_type::from_name("RuSt"));
            CHECK(c.data_as_string() == secret);
            CHECK(c.encoded_size() == bytes.size());
        }

        SUBCASE("consumes only its own bytes") {
            auto bytes = secret_chunk_bytes();
            auto next = raw_chunk(0, "IEND", "", 0xAE426082u);
            bytes.insert(bytes.end(), next.begin(), next.end());

            auto c = chunk::decode(bytes);
            CHECK(c.encoded_size() == 54);

            auto second = chunk::decode(bytes.data() + c.encoded_size(), bytes.size() - c.encoded_size());
            CHECK(second.type() == chunk_id::IEND);
            CHECK(second.length() == 0);
        }

        SUBCASE("arbitrary type bytes are accepted") {
            chunk built(chunk_type::from_bytes("\x01\x02\x03\x04"), std::string_view("payload"));
            auto c = chunk::decode(built.encode());
            CHECK(c == built);
            CHECK_FALSE(c.type().is_valid());
        }

        SUBCASE("wrong crc") {
            auto bytes = raw_chunk(42, "RuSt", secret, secret_crc + 1);
            try {
                (void) chunk::decode(bytes);
                FAIL("decode should have thrown");
            } catch (const parse_error& e) {
                CHECK(e.code() == error_code::checksum_mismatch);
            }
        }

        SUBCASE("header shorter than 8 bytes") {
            auto bytes = secret_chunk_bytes();
            for (std::size_t n = 0; n < 8; n++) {
                CAPTURE(n);
                try {
                    (void) chunk::decode(bytes.data(), n);
                    FAIL("decode should have thrown");
                } catch (const parse_error& e) {
                    CHECK(e.code() == error_code::truncated);
                }
            }
        }

        SUBCASE("data or crc cut short") {
            auto bytes = secret_chunk_bytes();
            for (std::size_t n = 8; n < bytes.size(); n++) {
                CAPTURE(n);
                try {
                    (void) chunk::decode(bytes.data(), n);
                    FAIL("decode should have thrown");
                } catch (const parse_error& e) {
                    CHECK(e.code() == error_code::truncated);
                }
            }
        }
    }

    TEST_CASE("chunk encode") {
        SUBCASE("canonical layout") {
            chunk c(chunk_type::from_name("RuSt"), secret);
            CHECK(c.encode() == secret_chunk_bytes());
        }

        SUBCASE("empty data") {
            chunk c(chunk_id::IEND, std::vector<std::byte>{});
            CHECK(c.encode() == raw_chunk(0, "IEND", "", 0xAE426082u));
        }

        SUBCASE("encode_to appends") {
            std::vector<std::byte> out = {std::byte(0xAA)};
            chunk c(chunk_type::from_name("RuSt"), secret);
            c.encode_to(out);
            REQUIRE(out.size() == 1 + c.encoded_size());
            CHECK(out[0] == std::byte(0xAA));
            CHECK(std::vector<std::byte>(out.begin() + 1, out.end()) == c.encode());
        }

        SUBCASE("decode of encode") {
            chunk c(chunk_type::from_name("miDl"), std::string_view("I am another chunk"));
            CHECK(chunk::decode(c.encode()) == c);
        }
    }

    TEST_CASE("chunk data as text") {
        SUBCASE("multi-byte UTF-8") {
            chunk c(chunk_type::from_name("ruSt"), std::string_view("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"));
            CHECK(c.data_as_string() == "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");
        }

        SUBCASE("invalid sequences") {
            const std::string bad[] = {
                "\xFF",                 // never valid
                "abc\xC3",              // truncated sequence
                "\xC3\x28",             // bad continuation
                "\xC0\xAF",             // overlong '/'
                "\xED\xA0\x80",         // UTF-16 surrogate
                "\xF4\x90\x80\x80",     // past U+10FFFF
                "\x80"                  // stray continuation
            };
            for (const auto& s : bad) {
                chunk c(chunk_type::from_name("ruSt"), s);
                try {
                    (void) c.data_as_string();
                    FAIL("data_as_string should have thrown");
                } catch (const usage_error& e) {
                    CHECK(e.code() == error_code::invalid_encoding);
                }
            }
        }

        SUBCASE("validator") {
            auto ok = bytes_of("plain ascii");
            CHECK(is_valid_utf8(ok.data(), ok.size()));
            CHECK(is_valid_utf8(nullptr, 0));
        }
    }

    TEST_CASE("chunk to_string") {
        chunk c(chunk_type::from_name("RuSt"), secret);
        std::string s = c.to_string();
        CHECK(s.find("length=42") != std::string::npos);
        CHECK(s.find("type='RuSt'") != std::string::npos);
        CHECK(s.find("data=42 bytes") != std::string::npos);
        CHECK(s.find("crc=0xabd1d84e") != std::string::npos);
    }
}
