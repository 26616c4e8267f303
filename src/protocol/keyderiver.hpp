#ifndef KEYGATE_PROTOCOL_KEYDERIVER_HPP
#define KEYGATE_PROTOCOL_KEYDERIVER_HPP

#include "calendar.hpp"
#include "../crypto/bigint.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace protocol {
namespace keyderiver {

using bigint::Int;

class KeyDerivationError : public std::runtime_error {
public:
    explicit KeyDerivationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Raised for a mode outside {Normal, Shared}. Retrying with the same
// arguments fails the same way.
class InvalidModeError : public KeyDerivationError {
public:
    explicit InvalidModeError(const std::string& msg) : KeyDerivationError(msg) {}
};

enum class Mode {
    Normal = 0,  // four digests, one per key
    Shared = 1   // one digest over key0 || key1
};

constexpr std::size_t NORMAL_KEY_COUNT = 4;

// Ordered [key0, key1, key2, key3], lowercase hex SHA-256.
using DigestSet = std::vector<std::string>;
using SharedDigest = std::string;
using Derived = std::variant<DigestSet, SharedDigest>;

// Intermediate values of the pipeline for one date.
struct KeyMaterial {
    Int raw_seed;
    std::string seed_digest;  // hash of raw_seed; nothing downstream reads it

    Int key0_raw;
    Int key1_raw;
    Int key2_raw;
    Int key3_raw;
};

// Runs the numeric part of the pipeline. Throws CalendarError for an invalid
// date.
KeyMaterial compute_key_material(const CalendarDate& date);

// SHA-256 hex of the decimal form of each of key0_raw..key3_raw, in order.
DigestSet digests_from_material(const KeyMaterial& material);

// SHA-256 hex of the concatenated hex digests key0 and key1.
SharedDigest shared_from_digests(const DigestSet& digests);

DigestSet derive_normal(const CalendarDate& date);
SharedDigest derive_shared(const CalendarDate& date);

// Mode-dispatching form. Throws InvalidModeError for an unsupported mode.
Derived derive(const CalendarDate& date, Mode mode);

// Mode conversions; both throw InvalidModeError.
Mode mode_from_int(int value);
Mode parse_mode(const std::string& name);
std::string mode_name(Mode mode);

} // namespace keyderiver
} // namespace protocol

#endif // KEYGATE_PROTOCOL_KEYDERIVER_HPP
