#pragma once

#include "./buffer_capacities.hpp"
#include "./into_inner_error.hpp"
#include "./io.hpp"
#include "./syserror.hpp"

#include <neo/fwd.hpp>
#include <neo/scope.hpp>
#include <neo/ufmt.hpp>

#include <system_error>
#include <vector>

namespace bufio {

/**
 * @brief Collects written bytes in memory and passes them to the wrapped stream in large writes.
 *
 * Bytes are held until the buffer would overflow, until `flush()`, or until the writer is
 * destroyed. A write at least as large as the buffer capacity goes straight to the stream.
 *
 * The buffered bytes are always the unwritten data in the order it was given. If the stream fails
 * part way through writing them out, the bytes it did accept are dropped from the front of the
 * buffer and the rest remain buffered.
 *
 * @tparam Stream The stream that receives the buffered bytes. Owned by the writer.
 */
template <writable_stream Stream>
class buf_writer {
    Stream                 _stream;
    std::vector<std::byte> _buf;
    std::size_t            _capacity;

    void _flush_discarding_errors() noexcept {
        try {
            flush_buffer();
        } catch (...) {
            // Discarded, whatever the stream threw
        }
    }

public:
    /// Wrap the given stream with a buffer of `default_buffer_size` bytes
    explicit buf_writer(Stream stream)
        : buf_writer(default_buffer_size, NEO_MOVE(stream)) {}

    /// Wrap the given stream with a buffer of `capacity` bytes
    buf_writer(std::size_t capacity, Stream stream)
        : _stream(NEO_MOVE(stream))
        , _capacity(capacity) {
        _buf.reserve(capacity);
    }

    buf_writer(buf_writer&&) = default;

    /**
     * @brief Write out this writer's buffer, then take over the stream and buffer of `other`.
     *
     * Errors while writing out the old buffer are discarded, as in the destructor.
     */
    buf_writer& operator=(buf_writer&& other) {
        if (this != &other) {
            _flush_discarding_errors();
            _stream   = NEO_MOVE(other._stream);
            _buf      = NEO_MOVE(other._buf);
            _capacity = other._capacity;
            other._buf.clear();
        }
        return *this;
    }

    /**
     * @brief Write out any buffered bytes.
     *
     * Errors from the stream are discarded: there is nobody to report them to. Use `flush()` or
     * `into_inner()` to observe them.
     */
    ~buf_writer() { _flush_discarding_errors(); }

    /// The maximum number of bytes that will be held before writing to the stream
    [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

    /// The bytes currently held in the buffer
    [[nodiscard]] const_buffer buffer() const noexcept {
        return const_buffer(_buf.data(), _buf.size());
    }

    /// Obtain the wrapped stream
    [[nodiscard]] const Stream& get_ref() const noexcept { return _stream; }

    /**
     * @brief Obtain the wrapped stream
     *
     * @note Writing to the stream directly will place those bytes before any that are still
     * buffered.
     */
    [[nodiscard]] Stream& get_mut() noexcept { return _stream; }

    /**
     * @brief Accept some bytes for writing
     *
     * @return std::size_t The number of bytes accepted. Buffered writes accept all bytes. A
     * write that bypasses the buffer returns what the stream accepted.
     */
    std::size_t write(const_buffer buf) {
        if (buf.size() == 0) {
            return 0;
        }
        if (_buf.size() + buf.size() > _capacity) {
            flush_buffer();
        }
        if (buf.size() >= _capacity) {
            return _stream.write(buf);
        }
        _buf.insert(_buf.end(), buf.data(), buf.data() + buf.size());
        return buf.size();
    }

    /**
     * @brief Write out all buffered bytes, then flush the wrapped stream
     */
    void flush() {
        flush_buffer();
        _stream.flush();
    }

    /**
     * @brief Write out all buffered bytes, without flushing the wrapped stream.
     *
     * Interrupted writes are retried.
     *
     * @throws std::system_error if the stream fails, or with std::errc::io_error if the stream
     * stops accepting bytes. In either case the unwritten bytes remain buffered.
     */
    void flush_buffer() {
        std::size_t written = 0;
        neo_defer { _buf.erase(_buf.begin(), _buf.begin() + written); };
        while (written < _buf.size()) {
            const_buffer remaining(_buf.data() + written, _buf.size() - written);
            std::size_t  n = 0;
            try {
                n = _stream.write(remaining);
            } catch (const std::system_error& err) {
                if (is_interrupted(err)) {
                    continue;
                }
                throw;
            }
            if (n == 0) {
                throw std::system_error(
                    std::make_error_code(std::errc::io_error),
                    neo::ufmt("failed to write the buffered data ({} bytes remain)",
                              remaining.size()));
            }
            written += n;
        }
    }

    /**
     * @brief Write out the buffer and return the wrapped stream.
     *
     * @throws into_inner_error<buf_writer> if writing the buffer fails. The exception holds this
     * writer, with the bytes that were not written still buffered.
     */
    [[nodiscard]] Stream into_inner() && {
        try {
            flush_buffer();
        } catch (const std::system_error& err) {
            throw into_inner_error<buf_writer>(err, NEO_MOVE(*this));
        }
        return NEO_MOVE(_stream);
    }
};

}  // namespace bufio
