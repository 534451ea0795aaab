#pragma once

#include "./io.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace bufio::testing {

/// Thrown by a mock_stream that is told to fail with something other than a std::exception
struct foreign_failure {};

inline constexpr std::size_t unlimited = std::numeric_limits<std::size_t>::max();

/// View the characters of a string as bytes
inline const_buffer bytes(std::string_view s) noexcept {
    return const_buffer(reinterpret_cast<const std::byte*>(s.data()), s.size());
}

/// View the characters of a string as writable bytes
inline mutable_buffer mbytes(std::string& s) noexcept {
    return mutable_buffer(reinterpret_cast<std::byte*>(s.data()), s.size());
}

/// Copy a buffer into a string, for comparisons
inline std::string str(const_buffer buf) {
    return std::string(reinterpret_cast<const char*>(buf.data()), buf.size());
}

/**
 * @brief An in-memory duplex stream that records every call made on it.
 *
 * Reads are served from `input`. Bytes accepted by writes are appended to `output`, and each
 * accepted write is also recorded separately in `writes`.
 */
class mock_stream : public byte_io_stream {
public:
    /// Bytes served to reads
    std::string input;
    /// How much of `input` has been read
    std::size_t input_pos = 0;
    /// Most bytes handed out by a single read
    std::size_t max_read = unlimited;
    /// The buffer size requested by each read call
    std::vector<std::size_t> read_sizes;
    /// Where the most recent read placed its bytes
    const std::byte* last_read_target = nullptr;

    /// Every byte accepted by a write
    std::string output;
    /// The bytes accepted by each successful write call
    std::vector<std::string> writes;
    /// Number of write calls, including failed ones
    std::size_t write_calls = 0;
    /// Most bytes accepted by a single write
    std::size_t max_write = unlimited;
    /// Successful write calls allowed before every write fails
    std::size_t writes_before_failure = unlimited;
    /// The error thrown by failing writes
    std::errc write_error = std::errc::broken_pipe;
    /// Fail writes with an exception that is not a std::system_error
    bool fail_with_runtime_error = false;
    /// Fail writes by throwing a foreign_failure
    bool fail_with_foreign_exception = false;
    /// Number of upcoming writes that report an interrupted system call
    int interrupted_writes = 0;

    /// Number of flush calls
    std::size_t flush_calls = 0;
    bool        fail_flush  = false;

    mock_stream() = default;
    explicit mock_stream(std::string in)
        : input(std::move(in)) {}

    std::string remaining_input() const { return input.substr(input_pos); }

private:
    std::size_t do_read_into(mutable_buffer buf) override {
        read_sizes.push_back(buf.size());
        last_read_target = buf.data();
        auto n = std::min({buf.size(), input.size() - input_pos, max_read});
        copy_bytes(buf, bytes(std::string_view(input).substr(input_pos, n)));
        input_pos += n;
        return n;
    }

    std::size_t do_write(const_buffer buf) override {
        ++write_calls;
        if (interrupted_writes > 0) {
            --interrupted_writes;
            throw std::system_error(std::make_error_code(std::errc::interrupted),
                                    "mock write interrupted");
        }
        if (writes.size() >= writes_before_failure) {
            if (fail_with_foreign_exception) {
                throw foreign_failure{};
            }
            if (fail_with_runtime_error) {
                throw std::runtime_error("mock write failed");
            }
            throw std::system_error(std::make_error_code(write_error), "mock write failed");
        }
        auto n     = std::min(buf.size(), max_write);
        auto chunk = str(const_buffer(buf.data(), n));
        output += chunk;
        writes.push_back(chunk);
        return n;
    }

    void do_flush() override {
        ++flush_calls;
        if (fail_flush) {
            throw std::system_error(std::make_error_code(std::errc::io_error),
                                    "mock flush failed");
        }
    }
};

}  // namespace bufio::testing
