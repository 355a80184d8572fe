//
// Whole-file helpers and the encode / decode / remove flow on disk
//

#include <doctest/doctest.h>
#include <pngchunk/file_io.hh>
#include <pngchunk/png.hh>
#include <pngchunk/exceptions.hh>

#include <filesystem>
#include <sstream>
#include <string>
#include "test_utils.hh"

using namespace pngchunk;

TEST_CASE("File I/O - read") {
    SUBCASE("fixture file") {
        auto data = read_file(std::filesystem::path(UNITTEST_PATH_TO_DATA_FILES) / "pixel.png");
        CHECK(data.size() == 69);
        CHECK(data == load_test_data("pixel.png"));
    }

    SUBCASE("missing file") {
        try {
            (void) read_file(output_path("does_not_exist.png"));
            FAIL("read_file should have thrown");
        } catch (const io_error& e) {
            CHECK(e.code() == error_code::io);
            CHECK(std::string(e.what()).find("does_not_exist.png") != std::string::npos);
        }
    }

    SUBCASE("stream") {
        std::istringstream is(std::string("abc\0def", 7));
        auto data = read_all(is);
        CHECK(data == bytes_of(std::string_view("abc\0def", 7)));
    }

    SUBCASE("empty stream") {
        std::istringstream is;
        CHECK(read_all(is).empty());
    }

    SUBCASE("stream in bad state") {
        std::istringstream is("data");
        is.setstate(std::ios::badbit);
        CHECK_THROWS_AS((void) read_all(is), io_error);
    }
}

TEST_CASE("File I/O - write") {
    SUBCASE("round trip") {
        auto path = output_path("round_trip.png");
        auto data = png::from_chunks(testing_chunks()).encode();
        write_file(path, data);
        CHECK(std::filesystem::file_size(path) == data.size());
        CHECK(read_file(path) == data);
    }

    SUBCASE("overwrite truncates") {
        auto path = output_path("overwrite.png");
        write_file(path, std::vector<std::byte>(500, std::byte(0x55)));
        auto small = png().encode();
        write_file(path, small);
        CHECK(read_file(path) == small);
    }

    SUBCASE("missing directory") {
        auto path = output_path("no_such_dir") / "out.png";
        CHECK_THROWS_AS(write_file(path, bytes_of("x")), io_error);
    }

    SUBCASE("stream") {
        std::ostringstream os;
        write_all(os, bytes_of("payload"));
        CHECK(os.str() == "payload");
    }
}

TEST_CASE("File I/O - message workflow") {
    auto path = output_path("message.png");
    write_file(path, load_test_data("pixel.png"));

    // encode
    {
        auto image = png::decode(read_file(path));
        image.append_chunk(chunk(chunk_type::from_name("ruSt"), std::string_view("meet at noon")));
        write_file(path, image.encode());
    }

    // decode
    {
        auto image = png::decode(read_file(path));
        const chunk* c = image.chunk_by_type("ruSt");
        REQUIRE(c != nullptr);
        CHECK(c->data_as_string() == "meet at noon");
    }

    // remove
    {
        auto image = png::decode(read_file(path));
        auto removed = image.remove_chunk("ruSt");
        CHECK(removed.data_as_string() == "meet at noon");
        write_file(path, image.encode());
    }

    CHECK(read_file(path) == load_test_data("pixel.png"));
}
