#pragma once
#include <string>
#include <cstddef>

namespace hookdeploy {

// ISO 8601 UTC timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.123Z
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// True if s begins with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Lowercase hex encoding of raw bytes
std::string hex_encode(const unsigned char* data, size_t len);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace hookdeploy
