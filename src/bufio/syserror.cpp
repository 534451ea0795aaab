#include "./syserror.hpp"

#include <cerrno>
#include <string>

using namespace bufio;

int bufio::get_current_error() noexcept { return errno; }

void bufio::throw_for_system_error_code(int error, std::string_view message) {
    throw std::system_error(std::error_code(error, std::system_category()), std::string(message));
}

void bufio::throw_current_error(std::string_view message) {
    throw_for_system_error_code(get_current_error(), message);
}

bool bufio::is_interrupted(const std::system_error& err) noexcept {
    return err.code() == std::errc::interrupted;
}
