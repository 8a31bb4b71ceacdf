#include "types.hpp"
#include <fmt/format.h>

std::string Error::to_string() const {
    if (command.empty()) {
        return message;
    }

    std::string stderr_text = stderr_data;
    while (!stderr_text.empty() && stderr_text.back() == '\n') {
        stderr_text.pop_back();
    }
    return fmt::format("`{}`\n  {}\n  {}", command, message, stderr_text);
}
