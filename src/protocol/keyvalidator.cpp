#include "keyvalidator.hpp"
#include "keyderiver.hpp"
#include "../crypto/bigint.hpp"

#include <algorithm>
#include <utility>

namespace protocol {
namespace keyvalidator {

std::string tier_name(AccessTier tier) {
    switch (tier) {
        case AccessTier::Standard:
            return "standard";
        case AccessTier::Elevated:
            return "elevated";
        case AccessTier::Rejected:
            return "rejected";
    }
    return "rejected";
}

AccessTier validate(const std::string& candidate, const CalendarDate& date) {
    keyderiver::DigestSet normal;
    keyderiver::SharedDigest shared;
    try {
        normal = keyderiver::derive_normal(date);
        shared = keyderiver::derive_shared(date);
    } catch (const bigint::BigIntError&) {
        // 0001-12-01: key1 is a real power of a negative base, no key exists
        return AccessTier::Rejected;
    }

    if (std::find(normal.begin(), normal.end(), candidate) != normal.end()) {
        return AccessTier::Standard;
    }
    if (candidate == shared) {
        return AccessTier::Elevated;
    }
    return AccessTier::Rejected;
}

KeyValidator::KeyValidator() : today_(local_today) {}

KeyValidator::KeyValidator(DateSource today) : today_(std::move(today)) {
    if (!today_) {
        throw CalendarError("KeyValidator requires a date source");
    }
}

AccessTier KeyValidator::validate(const std::string& candidate) const {
    return keyvalidator::validate(candidate, today_());
}

} // namespace keyvalidator
} // namespace protocol
