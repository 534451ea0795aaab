#include "./socket_pair.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <string_view>

TEST_CASE("Create a socket pair") {
    auto p = bufio::create_socket_pair();
    REQUIRE(p.first.is_open());
    REQUIRE(p.second.is_open());

    p.first.write_all(std::string_view("I am a string"));
    auto b = p.second.read(388);
    CHECK(b == "I am a string");

    // The other direction
    p.second.write_all(std::string_view("foobar"));
    b = p.first.read(3);
    CHECK(b == "foo");
    b = p.first.read(3);
    CHECK(b == "bar");
}

TEST_CASE("Read to the end of a socket") {
    auto p = bufio::create_socket_pair();
    p.first.write_all(std::string_view("first part, "));
    p.first.write_all(std::string_view("second part"));
    p.first.close();
    CHECK(p.second.read() == "first part, second part");
    // Subsequent reads see the end-of-stream again
    CHECK(p.second.read(10) == "");
}

TEST_CASE("Borrow a descriptor without taking ownership") {
    auto p = bufio::create_socket_pair();
    {
        bufio::native_io_stream_ref ref{p.first};
        CHECK(ref.get() == p.first.get());
        ref.write_all(std::string_view("borrowed"));
    }
    // The borrowed reference must not have closed the descriptor
    REQUIRE(p.first.is_open());
    CHECK(p.second.read(64) == "borrowed");
}

TEST_CASE("Release a descriptor") {
    auto p  = bufio::create_socket_pair();
    auto fd = p.first.release();
    CHECK_FALSE(p.first.is_open());
    bufio::native_io_stream adopted{std::move(fd)};
    CHECK(adopted.is_open());
}
