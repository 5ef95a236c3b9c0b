#include "cache_key.hpp"
#include "../util.hpp"

#ifdef PIPEGUARD_USE_COMMONCRYPTO
#include <CommonCrypto/CommonDigest.h>
#else
#include <openssl/sha.h>
#endif
#include <cstddef>

namespace pipeguard {

namespace {

std::string hex_encode(const unsigned char* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[(data[i] >> 4) & 0x0F]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

std::string sha256_hex(const std::string& data) {
#ifdef PIPEGUARD_USE_COMMONCRYPTO
    unsigned char hash[CC_SHA256_DIGEST_LENGTH];
    CC_SHA256(data.data(), static_cast<CC_LONG>(data.size()), hash);
    return hex_encode(hash, CC_SHA256_DIGEST_LENGTH);
#else
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return hex_encode(hash, SHA256_DIGEST_LENGTH);
#endif
}

} // namespace

std::string normalize_cache_input(const std::string& input) {
    return to_lower(trim(input));
}

std::string make_cache_key(const std::string& prefix, const std::string& input) {
    return prefix + ":" + sha256_hex(normalize_cache_input(input));
}

} // namespace pipeguard
