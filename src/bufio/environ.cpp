#include "./environ.hpp"

#include <cstdlib>

std::optional<std::string> bufio::getenv(const char* key) noexcept {
    auto ptr = std::getenv(key);
    if (ptr) {
        return std::make_optional(std::string(ptr));
    } else {
        return std::nullopt;
    }
}
