#pragma once

#include "./io.hpp"

#include <neo/fwd.hpp>

namespace bufio {

/**
 * @brief An owning I/O stream over a POSIX file descriptor.
 *
 * Every read and write is a single system call, which makes this the kind of
 * resource that wants a buffered_stream layered over it.
 */
class native_io_stream : public byte_io_stream {
public:
    using handle_type = int;

    static constexpr handle_type null_handle = -1;

private:
    handle_type _handle = null_handle;

    std::size_t do_read_into(mutable_buffer mbuf) override;
    std::size_t do_write(const_buffer cbuf) override;

public:
    /**
     * @brief Default-contsruct a null (unopened) stream
     */
    native_io_stream() = default;
    /// Move from another stream
    native_io_stream(native_io_stream&& other) noexcept { reset(other.release()); }
    /// Move-assign from another stream
    native_io_stream& operator=(native_io_stream&& o) noexcept {
        reset(o.release());
        return *this;
    }

    /// Adopt the given descriptor
    explicit native_io_stream(handle_type&& h) noexcept { reset(NEO_MOVE(h)); }

    /// Destroys and closes the stream
    ~native_io_stream() { reset(handle_type{null_handle}); }

    /**
     * @brief Obtain a copy of the descriptor managed by this object
     */
    [[nodiscard]] handle_type get() const noexcept { return _handle; }

    /// Determine whether this stream is open for I/O
    [[nodiscard]] bool is_open() const noexcept { return get() != null_handle; }

    /// Close and reset the stream
    void close() noexcept;

    /**
     * @brief Replace the descriptor managed by this object
     *
     * @param h A descriptor to swap into place. The previous descriptor, if any, is closed.
     */
    void reset(handle_type&& h) noexcept {
        if (is_open()) {
            close();
        }
        _handle = h;
    }

    /**
     * @brief Relinquish ownership of the managed descriptor and return it to the caller.
     *
     * @note It is the duty of the caller to ensure the returned descriptor will be closed properly
     */
    [[nodiscard]] handle_type release() noexcept {
        auto h  = _handle;
        _handle = null_handle;
        return h;
    }
};

/**
 * @brief A non-owning reference to a native descriptor byte stream.
 */
class native_io_stream_ref : native_io_stream {
public:
    native_io_stream_ref(handle_type h)
        : native_io_stream(NEO_MOVE(h)) {}
    ~native_io_stream_ref() { (void)release(); }

    native_io_stream_ref(const native_io_stream& io)
        : native_io_stream(io.get()) {}

    using native_io_stream::flush;
    using native_io_stream::get;
    using native_io_stream::is_open;
    using native_io_stream::read;
    using native_io_stream::read_into;
    using native_io_stream::write;
    using native_io_stream::write_all;
};

}  // namespace bufio
