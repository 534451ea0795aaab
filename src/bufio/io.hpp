#pragma once

#include "./trivial_range.hpp"

#include <concepts>
#include <cstdint>
#include <string>

namespace bufio {

/**
 * @brief A stream from which bytes can be read in blocking calls.
 *
 * `read_into` returns the number of bytes placed in the buffer. Zero indicates
 * end-of-stream. Failures are thrown as std::system_error.
 */
template <typename S>
concept readable_stream = requires(S& s, mutable_buffer mbuf) {
    { s.read_into(mbuf) } -> std::convertible_to<std::size_t>;
};

/**
 * @brief A stream into which bytes can be written in blocking calls.
 *
 * `write` returns the number of bytes that the stream accepted, which may be
 * less than the size of the buffer. `flush` pushes any data held by the stream
 * itself to its destination.
 */
template <typename S>
concept writable_stream = requires(S& s, const_buffer cbuf) {
    { s.write(cbuf) } -> std::convertible_to<std::size_t>;
    s.flush();
};

/**
 * @brief A duplex byte stream: readable and writable through the same object.
 */
template <typename S>
concept duplex_stream = readable_stream<S> && writable_stream<S>;

/**
 * @brief Abstract base class of objects used for byte-stream-oriented I/O
 */
class byte_io_stream {
public:
    virtual ~byte_io_stream() = default;

private:
    /// Provided by concrete derived classes
    virtual std::size_t do_read_into(mutable_buffer buf) = 0;
    /// Provided by concrete derived classes
    virtual std::size_t do_write(const_buffer buf) = 0;
    /// Streams that hold no data of their own have nothing to flush
    virtual void do_flush() {}

public:
    /**
     * @brief Read some bytes into the given buffer
     *
     * @return std::size_t The number of bytes that were read. Zero at end-of-stream.
     */
    std::size_t read_into(mutable_buffer buf) { return do_read_into(buf); }

    /**
     * @brief Read some data/objects from the stream
     *
     * @tparam T A trivially-copyable type to read from the stream
     * @param out The pointer-to-T instances where data will be placed
     * @param count The number of T objects that are pointed-to by `out`
     * @return std::size_t The number of T objects that were read
     */
    template <trivial_type T>
    std::size_t read_into(T* out, std::size_t count) {
        auto nbytes = do_read_into(neo::mutable_buffer(neo::byte_pointer(out), count * sizeof(T)));
        return nbytes / sizeof(T);
    }

    /**
     * @brief Read into the given contiguous range.
     *
     * @param out A contiguous range of trivially-copyable objects where the data will be stored
     * @return std::size_t The number of *objects* that were read
     *
     * @note Attempts to read 'size(out)' objects.
     */
    std::size_t read_into(mutable_trivial_range auto&& range) {
        return do_read_into(mutable_buffer(range)) / neo::data_type_size_v<decltype(range)>;
    }

    /**
     * @brief Read all data until the end-of-stream condition is hit
     *
     * @return std::string A string containing the contents that were read
     */
    std::string read();

    /**
     * @brief Read *at most* `count` bytes.
     *
     * @param count The number of bytes (char) to read, *at most*
     * @return std::string The bytes that were read from the stream
     *
     * @note The returned string will be *at most* `count` bytes long, and will
     *       be resized down to fit the amount of data that was actually read.
     */
    std::string read(std::size_t count);

    /**
     * @brief Write some of the given bytes
     *
     * @return std::size_t The number of bytes the stream accepted
     */
    std::size_t write(const_buffer buf) { return do_write(buf); }

    /**
     * @brief Write the given data into the stream
     *
     * @param data The data to be written
     * @returns The number of *objects* that were written
     */
    std::size_t write(trivial_range auto&& data) {
        auto nbytes = do_write(const_buffer(data));
        return nbytes / neo::data_type_size_v<decltype(data)>;
    }

    /**
     * @brief Write every byte of the given buffer, issuing as many writes as needed
     *
     * @throws std::system_error with std::errc::io_error if the stream stops accepting data
     */
    void write_all(const_buffer buf);

    /// Write every object of the given range
    void write_all(trivial_range auto&& data) { write_all(const_buffer(data)); }

    /// Push any data held by the stream to its destination
    void flush() { do_flush(); }
};

}  // namespace bufio
