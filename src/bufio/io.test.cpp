#include "./io.hpp"

#include "./mock_stream.test.hpp"

#include <catch2/catch.hpp>

#include <cstring>
#include <string>
#include <system_error>
#include <vector>

using bufio::testing::bytes;
using bufio::testing::mock_stream;

TEST_CASE("Write a whole buffer in pieces") {
    mock_stream s;
    s.max_write = 3;
    s.write_all(bytes("abcdefgh"));
    CHECK(s.writes == std::vector<std::string>{"abc", "def", "gh"});
}

TEST_CASE("A stream that stops accepting bytes fails write_all") {
    mock_stream s;
    s.max_write = 0;
    try {
        s.write_all(bytes("abc"));
        FAIL("write_all() should have thrown");
    } catch (const std::system_error& err) {
        CHECK(err.code() == std::errc::io_error);
    }
}

TEST_CASE("Read everything up to the end of the stream") {
    mock_stream s{std::string(10000, 'x')};
    // Short reads do not end the stream
    s.max_read = 7;
    auto content = s.read();
    CHECK(content == std::string(10000, 'x'));
}

TEST_CASE("Read a bounded amount") {
    mock_stream s{"abcdef"};
    CHECK(s.read(4) == "abcd");
    CHECK(s.read(4) == "ef");
    CHECK(s.read(4) == "");
}

TEST_CASE("Read trivial objects") {
    std::string raw(sizeof(int) * 2, '\0');
    int         values[2] = {7, 42};
    std::memcpy(raw.data(), values, raw.size());
    mock_stream s{raw};

    int got[2] = {};
    CHECK(s.read_into(got, 2) == 2);
    CHECK(got[0] == 7);
    CHECK(got[1] == 42);
}

TEST_CASE("Flushing a stream with nothing of its own to flush") {
    struct null_stream : bufio::byte_io_stream {
        std::size_t do_read_into(bufio::mutable_buffer) override { return 0; }
        std::size_t do_write(bufio::const_buffer buf) override { return buf.size(); }
    };
    null_stream s;
    CHECK_NOTHROW(s.flush());
    CHECK(s.read(10) == "");
}
