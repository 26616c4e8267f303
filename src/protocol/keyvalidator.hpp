#ifndef KEYGATE_PROTOCOL_KEYVALIDATOR_HPP
#define KEYGATE_PROTOCOL_KEYVALIDATOR_HPP

#include "calendar.hpp"

#include <string>

namespace protocol {
namespace keyvalidator {

enum class AccessTier {
    Rejected = 0,
    Standard = 1,  // matched one of the four normal digests
    Elevated = 2   // matched the shared digest
};

std::string tier_name(AccessTier tier);

// Classify a candidate against the keys for the given date. Never fails for
// any candidate; non-matching input (including empty strings) is Rejected.
AccessTier validate(const std::string& candidate, const CalendarDate& date);

// -----------------------------------------------------------------------------
// KeyValidator - validates against "today" as reported by a date source
// -----------------------------------------------------------------------------
class KeyValidator {
public:
    // Defaults to the host local date.
    KeyValidator();
    explicit KeyValidator(DateSource today);

    // The date source is consulted on every call, so the accepted keys change
    // at local midnight.
    AccessTier validate(const std::string& candidate) const;

private:
    DateSource today_;
};

} // namespace keyvalidator
} // namespace protocol

#endif // KEYGATE_PROTOCOL_KEYVALIDATOR_HPP
