#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Name of the local user running the process ($USER / $USERNAME), or "".
std::string current_user();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
