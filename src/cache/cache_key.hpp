#pragma once
#include <string>

namespace pipeguard {

// Lowercase and trim so that equivalent inputs share a key.
std::string normalize_cache_input(const std::string& input);

// "<prefix>:<sha256 hex of normalized input>"
std::string make_cache_key(const std::string& prefix, const std::string& input);

} // namespace pipeguard
