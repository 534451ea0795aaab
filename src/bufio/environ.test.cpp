#include "./environ.hpp"

#include <catch2/catch.hpp>

TEST_CASE("Get an environment variable") {
    auto path = bufio::getenv("PATH");
    CHECK(path);

    auto missing = bufio::getenv("BUFIO_THIS_VARIABLE_IS_NOT_SET");
    CHECK_FALSE(missing);
}
