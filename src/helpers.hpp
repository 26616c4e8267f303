#ifndef KEYGATE_HELPERS_HPP
#define KEYGATE_HELPERS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <initializer_list>
#include <vector>

namespace keygate {
namespace utils {

    using Bytes = std::vector<uint8_t>;

    // libsodium must be initialized before any hashing (safe to call repeatedly)
    void ensure_sodium_init();

    // Hex helpers (lowercase output)
    std::string bytes_to_hex(const Bytes& bytes);

    // True for a 64-character lowercase hex string, the shape of every key.
    bool is_hex_digest(const std::string& s);

    Bytes to_bytes(const std::string& s);

    // Hash utilities (SHA-256)
    Bytes hash_all(std::initializer_list<Bytes> inputs);

    // SHA-256 of the raw characters of s, lowercase hex (64 chars)
    std::string sha256_hex(const std::string& s);

} // namespace utils
} // namespace keygate

#endif // KEYGATE_HELPERS_HPP
