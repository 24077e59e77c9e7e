#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace streamtap {

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Case-insensitive suffix test (ASCII)
bool ends_with_nocase(const std::string& s, const std::string& suffix);

// Random decimal digits, e.g. for anonymous chat nicks
std::string random_digits(size_t count);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates parent directories. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace streamtap
