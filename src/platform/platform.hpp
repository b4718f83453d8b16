#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp unless TMPDIR is set).
std::filesystem::path temp_dir();

// True if fd refers to a terminal.
bool is_tty(int fd);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
