#include "./buffer_capacities.hpp"

#include "./environ.hpp"

#include <neo/ufmt.hpp>

#include <charconv>
#include <stdexcept>

using namespace bufio;

namespace {

std::size_t size_from_env(const char* varname, std::size_t dflt) {
    auto value = bufio::getenv(varname);
    if (!value) {
        return dflt;
    }
    std::size_t ret   = 0;
    auto        first = value->data();
    auto        last  = first + value->size();
    auto [ptr, ec]    = std::from_chars(first, last, ret);
    if (ec != std::errc{} || ptr != last || ret == 0) {
        throw std::invalid_argument(
            neo::ufmt("Invalid buffer size '{}' given in environment variable {}",
                      *value,
                      varname));
    }
    return ret;
}

}  // namespace

buffer_capacities buffer_capacities::from_environment() {
    return buffer_capacities{
        .read  = size_from_env("BUFIO_READ_BUFFER_SIZE", default_buffer_size),
        .write = size_from_env("BUFIO_WRITE_BUFFER_SIZE", default_buffer_size),
    };
}
