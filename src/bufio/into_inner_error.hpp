#pragma once

#include <neo/fwd.hpp>

#include <memory>
#include <system_error>

namespace bufio {

/**
 * @brief Exception thrown by `into_inner()` when buffered output could not be written out.
 *
 * Carries the code and message of the error that stopped the write, and the object that
 * was being unwrapped, rebuilt with its unwritten bytes still buffered. The caller may inspect
 * it, retry the unwrap, or salvage the buffered data.
 *
 * @tparam Inner The buffered object that was being unwrapped
 */
template <typename Inner>
class into_inner_error : public std::system_error {
    // Shared so that the exception object remains copyable
    std::shared_ptr<Inner> _inner;

public:
    into_inner_error(const std::system_error& err, Inner&& inner)
        : std::system_error(err)
        , _inner(std::make_shared<Inner>(NEO_MOVE(inner))) {}

    /// The recovered object
    [[nodiscard]] Inner& get() const noexcept { return *_inner; }

    /**
     * @brief Take the recovered object out of this exception.
     *
     * @note Afterwards, `get()` refers to a moved-from object
     */
    [[nodiscard]] Inner into_inner() { return NEO_MOVE(*_inner); }
};

}  // namespace bufio
