#include "./io.hpp"

#include <neo/as_buffer.hpp>

#include <system_error>

using namespace bufio;

std::string byte_io_stream::read() {
    // Start with 4kb
    std::string ret;
    ret.resize(1024 * 4);
    // Keep track of how far into 'ret' we have read
    std::size_t offset = 0;
    while (true) {
        if (offset == ret.size()) {
            // Out of room. Double the buffer size
            ret.resize(ret.size() * 2);
        }
        // Read!
        const auto nread = read_into(neo::as_buffer(ret) + offset);
        if (nread == 0) {
            // A short read may only mean the stream had nothing more on hand. Only
            // a zero-length read marks the end.
            break;
        }
        // Advance the offset
        offset += nread;
    }
    // Shrink back down to how much we actually read
    ret.resize(offset);
    return ret;
}

std::string byte_io_stream::read(std::size_t count) {
    std::string ret;
    ret.resize(count);
    auto nread = read_into(neo::as_buffer(ret));
    ret.resize(nread);
    return ret;
}

void byte_io_stream::write_all(const_buffer buf) {
    while (buf.size() != 0) {
        const auto nwritten = do_write(buf);
        if (nwritten == 0) {
            throw std::system_error(std::make_error_code(std::errc::io_error),
                                    "failed to write whole buffer");
        }
        buf = buf + nwritten;
    }
}
