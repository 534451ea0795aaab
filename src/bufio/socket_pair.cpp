#include "./socket_pair.hpp"

#include "./syserror.hpp"

#include <utility>

#include <sys/socket.h>

bufio::socket_pair bufio::create_socket_pair() {
    int  fds[2] = {};
    auto rc     = ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds);
    if (rc == -1) {
        throw_current_error("::socketpair() failed in bufio::create_socket_pair()");
    }
    bufio::socket_pair ret;
    ret.first.reset(std::move(fds[0]));
    ret.second.reset(std::move(fds[1]));
    return ret;
}
