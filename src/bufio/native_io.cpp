#include "./native_io.hpp"

#include "./syserror.hpp"

#include <neo/assert.hpp>

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>

using namespace bufio;

void native_io_stream::close() noexcept {
    ::close(_handle);
    _handle = null_handle;
}

std::size_t native_io_stream::do_write(const_buffer cbuf) {
    neo_assert(expects,
               is_open(),
               "Attempted to write data to a closed file descriptor",
               cbuf.size());
    // A peer that has gone away must be reported as EPIPE rather than raising SIGPIPE
    auto nwritten = ::send(get(), cbuf.data(), cbuf.size(), MSG_NOSIGNAL);
    if (nwritten < 0 && errno == ENOTSOCK) {
        nwritten = ::write(get(), cbuf.data(), cbuf.size());
    }
    if (nwritten < 0) {
        throw_current_error("::write() on file descriptor failed");
    }
    return static_cast<std::size_t>(nwritten);
}

std::size_t native_io_stream::do_read_into(mutable_buffer mbuf) {
    if (mbuf.size() == 0) {
        return 0;
    }
    neo_assert(expects,
               is_open(),
               "Attempted to read data from a closed file descriptor",
               mbuf.size());
    auto nread = ::read(get(), mbuf.data(), mbuf.size());
    if (nread < 0) {
        throw_current_error("::read() on file descriptor failed");
    }
    return static_cast<std::size_t>(nread);
}
