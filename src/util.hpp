#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace pipeguard {

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via a sibling .tmp file and rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// Ratio as a percentage rounded to one decimal (0 when denominator is 0)
double percent_of(uint64_t numerator, uint64_t denominator);

} // namespace pipeguard
