#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Expand a leading "~/" against home_dir(). Other paths are returned as-is.
std::filesystem::path expand_home(const std::string& path);

} // namespace platform
