#pragma once

#include "./buffer_capacities.hpp"
#include "./io.hpp"

#include <neo/assert.hpp>
#include <neo/fwd.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace bufio {

/**
 * @brief Reads from the wrapped source in large chunks and hands the bytes out in smaller pieces.
 *
 * The buffer holds a window of bytes that have been read from the source but not yet consumed.
 * The source is only read when that window is empty.
 *
 * @tparam Source The stream that supplies bytes. Owned by the reader.
 */
template <readable_stream Source>
class buf_reader {
    Source                 _source;
    std::vector<std::byte> _buf;
    /// Bytes in [_pos, _filled) of _buf are unconsumed
    std::size_t _pos    = 0;
    std::size_t _filled = 0;

public:
    /// Wrap the given source with a buffer of `default_buffer_size` bytes
    explicit buf_reader(Source source)
        : buf_reader(default_buffer_size, NEO_MOVE(source)) {}

    /// Wrap the given source with a buffer of `capacity` bytes
    buf_reader(std::size_t capacity, Source source)
        : _source(NEO_MOVE(source))
        , _buf(capacity) {}

    [[nodiscard]] std::size_t capacity() const noexcept { return _buf.size(); }

    /// The unconsumed bytes, without reading any more from the source
    [[nodiscard]] const_buffer buffer() const noexcept {
        return const_buffer(_buf.data() + _pos, _filled - _pos);
    }

    /// Drop every unconsumed byte from the buffer
    void discard_buffer() noexcept {
        _pos    = 0;
        _filled = 0;
    }

    [[nodiscard]] const Source& get_ref() const noexcept { return _source; }

    /**
     * @brief Obtain the wrapped source
     *
     * @note Bytes read directly from the source are not seen by the buffer, and the buffer may
     * already hold bytes that come before them.
     */
    [[nodiscard]] Source& get_mut() noexcept { return _source; }

    /**
     * @brief Get the window of unconsumed bytes, reading more from the source if it is empty.
     *
     * @return const_buffer The unconsumed bytes. Empty only at end-of-stream.
     */
    const_buffer fill_buf() {
        if (_pos >= _filled) {
            auto nread = _source.read_into(mutable_buffer(_buf.data(), _buf.size()));
            neo_assert(ensures,
                       nread <= _buf.size(),
                       "Source reported reading more bytes than were requested",
                       nread,
                       _buf.size());
            _pos    = 0;
            _filled = nread;
        }
        return buffer();
    }

    /**
     * @brief Mark `n` bytes at the front of the window as consumed.
     *
     * Consuming more than the window holds consumes exactly the window.
     */
    void consume(std::size_t n) noexcept { _pos += std::min(n, _filled - _pos); }

    /**
     * @brief Read some bytes into `dest`
     *
     * @return std::size_t The number of bytes read. Zero at end-of-stream, or if `dest` is empty.
     */
    std::size_t read_into(mutable_buffer dest) {
        if (dest.size() == 0) {
            return 0;
        }
        if (_pos == _filled && dest.size() >= capacity()) {
            // Nothing is buffered, and the caller wants at least a buffer's worth. Skip the copy.
            discard_buffer();
            return _source.read_into(dest);
        }
        auto n = copy_bytes(dest, fill_buf());
        consume(n);
        return n;
    }

    /**
     * @brief Append bytes to `out` up to and including `delim`, or until end-of-stream.
     *
     * @return std::size_t The number of bytes appended
     */
    std::size_t read_until(std::byte delim, std::string& out) {
        std::size_t total = 0;
        while (true) {
            auto avail = fill_buf();
            if (avail.size() == 0) {
                return total;
            }
            auto first = avail.data();
            auto last  = first + avail.size();
            auto found = std::find(first, last, delim);
            auto stop  = found == last ? last : found + 1;
            auto n     = static_cast<std::size_t>(stop - first);
            out.append(reinterpret_cast<const char*>(first), n);
            consume(n);
            total += n;
            if (found != last) {
                return total;
            }
        }
    }

    /// Append one line, including its '\n' terminator if there is one, to `out`
    std::size_t read_line(std::string& out) { return read_until(std::byte{'\n'}, out); }

    /// Return the source. Unconsumed bytes are lost.
    [[nodiscard]] Source into_inner() && { return NEO_MOVE(_source); }
};

}  // namespace bufio
