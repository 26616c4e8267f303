#include "helpers.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <sodium.h>

namespace keygate {
namespace utils {

void ensure_sodium_init() {
    // Function-local static: initialized once even with concurrent callers,
    // and retried on the next call if sodium_init fails.
    static const bool initialized = []() {
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium");
        }
        return true;
    }();
    (void)initialized;
}

std::string bytes_to_hex(const Bytes& bytes) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (const auto& byte : bytes) ss << std::setw(2) << static_cast<int>(byte);
    return ss.str();
}

bool is_hex_digest(const std::string& s) {
    if (s.size() != crypto_hash_sha256_BYTES * 2) return false;
    for (char c : s) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}

Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

Bytes hash_all(std::initializer_list<Bytes> inputs) {
    ensure_sodium_init();
    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);

    for (const auto& input : inputs) {
        crypto_hash_sha256_update(&state, input.data(), input.size());
    }

    Bytes result(crypto_hash_sha256_BYTES);
    crypto_hash_sha256_final(&state, result.data());
    return result;
}

std::string sha256_hex(const std::string& s) {
    return bytes_to_hex(hash_all({to_bytes(s)}));
}

} // namespace utils
} // namespace keygate
