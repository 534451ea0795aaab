#pragma once

#include "./buf_reader.hpp"
#include "./buf_writer.hpp"
#include "./buffer_capacities.hpp"
#include "./into_inner_error.hpp"
#include "./io.hpp"

#include <neo/assert.hpp>
#include <neo/fwd.hpp>

#include <optional>
#include <string>
#include <utility>

namespace bufio {

namespace detail {

/**
 * @brief The source of a buffered_stream's read buffer: holds the write buffer, and reads
 * straight through it from the stream it owns.
 *
 * The writer slot is only ever empty inside buffered_stream::into_inner().
 */
template <duplex_stream Stream>
class writer_slot {
    std::optional<buf_writer<Stream>> _writer;

public:
    writer_slot(std::size_t write_capacity, Stream stream)
        : _writer(std::in_place, write_capacity, NEO_MOVE(stream)) {}

    buf_writer<Stream>& writer() noexcept {
        neo_assert(invariant,
                   _writer.has_value(),
                   "The write buffer of a buffered_stream was accessed while it was detached");
        return *_writer;
    }

    const buf_writer<Stream>& writer() const noexcept {
        neo_assert(invariant,
                   _writer.has_value(),
                   "The write buffer of a buffered_stream was accessed while it was detached");
        return *_writer;
    }

    std::optional<buf_writer<Stream>>& slot() noexcept { return _writer; }

    std::size_t read_into(mutable_buffer buf) { return writer().get_mut().read_into(buf); }
};

}  // namespace detail

/**
 * @brief Wraps a duplex stream and buffers both its input and its output.
 *
 * Each read or write on a socket is a system call. A buffered_stream keeps one in-memory buffer
 * for bytes read and another for bytes to be written, and makes large, infrequent calls on the
 * underlying stream.
 *
 * The two buffers are completely independent: writing does not disturb buffered input, and
 * reading does not flush buffered output. Protocols that need the two directions synchronized
 * must call `flush()` themselves.
 *
 * Buffered output is written out when the stream is destroyed. Errors at that point are
 * silently discarded, so call `flush()` or `into_inner()` to observe them.
 *
 * @tparam Stream The underlying duplex stream. Owned by the buffered_stream.
 */
template <duplex_stream Stream>
class buffered_stream : public byte_io_stream {
    using writer_type = buf_writer<Stream>;

    buf_reader<detail::writer_slot<Stream>> _inner;

    writer_type&       _writer() noexcept { return _inner.get_mut().writer(); }
    const writer_type& _writer() const noexcept { return _inner.get_ref().writer(); }

    std::size_t do_read_into(mutable_buffer buf) override { return _inner.read_into(buf); }
    std::size_t do_write(const_buffer buf) override { return _writer().write(buf); }
    void        do_flush() override { _writer().flush(); }

public:
    /// Wrap the given stream, with buffers of `default_buffer_size` bytes
    explicit buffered_stream(Stream stream)
        : buffered_stream(buffer_capacities{}, NEO_MOVE(stream)) {}

    /// Wrap the given stream, with buffers of the given sizes
    buffered_stream(buffer_capacities caps, Stream stream)
        : _inner(caps.read, detail::writer_slot<Stream>(caps.write, NEO_MOVE(stream))) {}

    /// Wrap the given stream, with buffers of the given sizes
    buffered_stream(std::size_t read_capacity, std::size_t write_capacity, Stream stream)
        : buffered_stream(buffer_capacities{.read = read_capacity, .write = write_capacity},
                          NEO_MOVE(stream)) {}

    [[nodiscard]] std::size_t read_capacity() const noexcept { return _inner.capacity(); }
    [[nodiscard]] std::size_t write_capacity() const noexcept { return _writer().capacity(); }

    /// Bytes that have been read from the stream but not yet consumed
    [[nodiscard]] const_buffer read_buffer() const noexcept { return _inner.buffer(); }
    /// Bytes that have been written but not yet passed to the stream
    [[nodiscard]] const_buffer write_buffer() const noexcept { return _writer().buffer(); }

    /// Obtain the underlying stream
    [[nodiscard]] const Stream& get_ref() const noexcept { return _writer().get_ref(); }

    /**
     * @brief Obtain the underlying stream.
     *
     * @note It is inadvisable to read directly from or write directly to the underlying stream:
     * the buffers will not see those bytes.
     */
    [[nodiscard]] Stream& get_mut() noexcept { return _writer().get_mut(); }

    /// @see buf_reader::fill_buf
    const_buffer fill_buf() { return _inner.fill_buf(); }
    /// @see buf_reader::consume
    void consume(std::size_t n) noexcept { _inner.consume(n); }
    /// @see buf_reader::read_until
    std::size_t read_until(std::byte delim, std::string& out) {
        return _inner.read_until(delim, out);
    }
    /// @see buf_reader::read_line
    std::size_t read_line(std::string& out) { return _inner.read_line(out); }

    /**
     * @brief Unwrap this buffered_stream, returning the underlying stream.
     *
     * Buffered output is written out before the stream is returned. Any unconsumed bytes in the
     * read buffer are lost, whether or not the unwrap succeeds.
     *
     * @throws into_inner_error<buffered_stream> if the buffered output could not be written. The
     * exception carries this buffered_stream, with the unwritten bytes still in its write buffer,
     * ready to be used again.
     */
    [[nodiscard]] Stream into_inner() && {
        neo_assertion_breadcrumbs("Unwrapping a buffered_stream");
        auto& slot = _inner.get_mut().slot();
        neo_assert(invariant,
                   slot.has_value(),
                   "Attempted to unwrap a buffered_stream whose write buffer is detached");
        writer_type writer = NEO_MOVE(*slot);
        slot.reset();
        _inner.discard_buffer();
        try {
            return NEO_MOVE(writer).into_inner();
        } catch (into_inner_error<writer_type>& err) {
            slot.emplace(err.into_inner());
            throw into_inner_error<buffered_stream>(err, NEO_MOVE(*this));
        } catch (...) {
            slot.emplace(NEO_MOVE(writer));
            throw;
        }
    }
};

}  // namespace bufio
