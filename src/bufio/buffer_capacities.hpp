#pragma once

#include <cstddef>

namespace bufio {

/// The capacity of each buffer of a buffered stream unless configured otherwise
inline constexpr std::size_t default_buffer_size = 64 * 1024;

/**
 * @brief The sizes of the two independent buffers of a buffered_stream
 */
struct buffer_capacities {
    /// Capacity of the inbound (read) buffer, in bytes
    std::size_t read = default_buffer_size;
    /// Capacity of the outbound (write) buffer, in bytes
    std::size_t write = default_buffer_size;

    /**
     * @brief Load capacities from the `BUFIO_READ_BUFFER_SIZE` and `BUFIO_WRITE_BUFFER_SIZE`
     * environment variables.
     *
     * Unset variables leave the default in place.
     *
     * @throws std::invalid_argument if a variable is set but is not a positive decimal integer
     */
    static buffer_capacities from_environment();
};

}  // namespace bufio
