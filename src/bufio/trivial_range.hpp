#pragma once

#include <neo/const_buffer.hpp>
#include <neo/mutable_buffer.hpp>
#include <neo/trivial_range.hpp>

#include <cstddef>
#include <cstring>

namespace bufio {

using neo::const_buffer;
using neo::mutable_buffer;
using neo::mutable_trivial_range;
using neo::trivial_range;
using neo::trivial_type;

/**
 * @brief Copy as many bytes as will fit from @param src into @param dest
 *
 * @return std::size_t The number of bytes that were copied
 */
inline std::size_t copy_bytes(mutable_buffer dest, const_buffer src) noexcept {
    const auto n = dest.size() < src.size() ? dest.size() : src.size();
    if (n) {
        std::memcpy(dest.data(), src.data(), n);
    }
    return n;
}

}  // namespace bufio
