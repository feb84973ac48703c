#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// True if path names a regular file the current user may execute.
bool is_executable(const std::filesystem::path& path);

// Search PATH for an executable. Names containing a '/' are checked as-is.
std::optional<std::filesystem::path> find_executable(const std::string& name);

// Value of an environment variable, or empty when unset.
std::string env_or_empty(const char* name);

} // namespace platform
