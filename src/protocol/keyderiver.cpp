#include "keyderiver.hpp"
#include "../helpers.hpp"

#include <cmath>
#include <initializer_list>

namespace protocol {
namespace keyderiver {

using keygate::utils::sha256_hex;
using bigint::round_to_int;
using bigint::round_half_even;
using bigint::ratio_to_double;
using bigint::to_double;

// Every round() below is round-half-to-even, and every mix of a big integer
// with a double goes through a correctly rounded conversion. Changing either
// changes the keys for some dates.

KeyMaterial compute_key_material(const CalendarDate& date) {
    const CalendarDate d = make_date(date.year, date.month, date.day);
    const int year = d.year;
    const int month = d.month;
    const int day = d.day;

    const Int Y(year);
    const Int M(month);
    const Int D(day);

    KeyMaterial km;

    km.raw_seed = bigint::pow(M, 2) * bigint::pow(Y, day) * bigint::pow(Int(2), day);
    km.seed_digest = sha256_hex(bigint::to_string(km.raw_seed));

    // key0 = 2*year + 7*month^round(day/2.5) + day^(round(day/2) + round(day%3 + 0.5^(day^0.6)))
    const unsigned month_exp = static_cast<unsigned>(round_half_even(day / 2.5));
    const double fuzz = std::pow(0.5, std::pow(static_cast<double>(day), 0.6));
    const unsigned day_exp =
        static_cast<unsigned>(round_half_even(day / 2.0)) +
        static_cast<unsigned>(round_half_even(static_cast<double>(day % 3) + fuzz));
    km.key0_raw = Int(2 * year) + Int(7) * bigint::pow(M, month_exp) + bigint::pow(D, day_exp);

    // key1 = round((key0 + 1 - month)^0.8)
    km.key1_raw = round_to_int(std::pow(to_double(km.key0_raw + Int(1) - M), 0.8));

    // key2 = round(key0*(month + year - 2*day) + key1^0.5 - 2^month)
    const Int product = km.key0_raw * Int(month + year - day * 2);
    km.key2_raw = round_to_int(
        (to_double(product) + std::pow(to_double(km.key1_raw), 0.5)) - to_double(bigint::pow(Int(2), month)));

    // key3 = round(((key1 + key2)/2 + (key1/key0)^(day + (month%3)%2)) * month^3.14)
    const double half_sum = ratio_to_double(km.key1_raw + km.key2_raw, Int(2));
    const double ratio = ratio_to_double(km.key1_raw, km.key0_raw);
    const int ratio_exp = day + (month % 3) % 2;
    const double scale = std::pow(static_cast<double>(month), 3.14);
    km.key3_raw = round_to_int((half_sum + std::pow(ratio, static_cast<double>(ratio_exp))) * scale);

    return km;
}

DigestSet digests_from_material(const KeyMaterial& material) {
    DigestSet digests;
    digests.reserve(NORMAL_KEY_COUNT);
    for (const Int* k : {&material.key0_raw, &material.key1_raw, &material.key2_raw, &material.key3_raw}) {
        digests.push_back(sha256_hex(bigint::to_string(*k)));
    }
    return digests;
}

SharedDigest shared_from_digests(const DigestSet& digests) {
    if (digests.size() < 2) {
        throw KeyDerivationError("Shared digest needs key0 and key1");
    }
    return sha256_hex(digests[0] + digests[1]);
}

DigestSet derive_normal(const CalendarDate& date) {
    return digests_from_material(compute_key_material(date));
}

SharedDigest derive_shared(const CalendarDate& date) {
    return shared_from_digests(derive_normal(date));
}

Derived derive(const CalendarDate& date, Mode mode) {
    switch (mode) {
        case Mode::Normal:
            return derive_normal(date);
        case Mode::Shared:
            return derive_shared(date);
    }
    throw InvalidModeError("Unsupported key mode: " + std::to_string(static_cast<int>(mode)));
}

Mode mode_from_int(int value) {
    switch (value) {
        case static_cast<int>(Mode::Normal):
            return Mode::Normal;
        case static_cast<int>(Mode::Shared):
            return Mode::Shared;
        default:
            throw InvalidModeError("Unsupported key mode: " + std::to_string(value));
    }
}

Mode parse_mode(const std::string& name) {
    if (name == "normal") return Mode::Normal;
    if (name == "shared") return Mode::Shared;
    throw InvalidModeError("Unsupported key mode: '" + name + "'");
}

std::string mode_name(Mode mode) {
    switch (mode) {
        case Mode::Normal:
            return "normal";
        case Mode::Shared:
            return "shared";
    }
    throw InvalidModeError("Unsupported key mode: " + std::to_string(static_cast<int>(mode)));
}

} // namespace keyderiver
} // namespace protocol
