#pragma once

#include <string_view>
#include <system_error>

namespace bufio {

/// Get the current OS error code
[[nodiscard]] int get_current_error() noexcept;

/**
 * @brief Throw a std::system_error that contains the given OS error code and the associated string
 * message
 *
 * @param code An OS-level error code number
 * @param message A message to include in the exception
 */
[[noreturn]] void throw_for_system_error_code(int code, std::string_view message);

/**
 * @brief Throw a std::system_error for the current OS error code, using the associated string
 * message
 *
 * @param message A string message to include in the exception
 */
[[noreturn]] void throw_current_error(std::string_view message);

/**
 * @brief Determine whether the given error is the result of an interrupted system call, after
 * which the operation may simply be attempted again.
 */
[[nodiscard]] bool is_interrupted(const std::system_error& err) noexcept;

}  // namespace bufio
