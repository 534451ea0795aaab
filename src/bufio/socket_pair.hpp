#pragma once

#include "./native_io.hpp"

namespace bufio {

/**
 * @brief An aggregate of two connected, bidirectional stream socket endpoints.
 *
 * Bytes written to one endpoint are read from the other, in both directions.
 */
struct socket_pair {
    /// The first endpoint
    native_io_stream first;
    /// The second endpoint
    native_io_stream second;
};

/// Create a new pair of connected local stream sockets within the current process
socket_pair create_socket_pair();

}  // namespace bufio
