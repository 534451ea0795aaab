#pragma once

#include <optional>
#include <string>

namespace bufio {

/**
 * @brief Get the environment variable named by the given key
 *
 * @param key The name of an environment variable to get
 */
std::optional<std::string> getenv(const char* key) noexcept;

}  // namespace bufio
