#pragma once

#include <string>
#include <cstdint>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Returns a fresh, not-yet-existing path inside `dir` named <prefix>_<random hex>.
std::filesystem::path unique_path(const std::filesystem::path& dir, const std::string& prefix);

// Append `len` bytes to `path` (created if missing), then flush and fsync
// before returning. Returns 0 on success, errno on failure.
int append_durable(const std::filesystem::path& path, const char* data, size_t len);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
