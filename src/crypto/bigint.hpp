#ifndef KEYGATE_CRYPTO_BIGINT_HPP
#define KEYGATE_CRYPTO_BIGINT_HPP

#include <mcl/vint.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace bigint {

using Int = mcl::Vint;

class BigIntError : public std::runtime_error {
public:
    explicit BigIntError(const std::string& msg) : std::runtime_error(msg) {}
};

// -----------------------------------------------------------------------------
// Construction / formatting
// -----------------------------------------------------------------------------
Int from_int(int64_t v);

// Canonical base-10 form: no leading zeros, '-' prefix when negative.
std::string to_string(const Int& v);

// base^exp by square-and-multiply, exact.
Int pow(const Int& base, unsigned exp);

Int abs(const Int& v);

// -----------------------------------------------------------------------------
// Integer <-> double conversions
//
// All conversions are correctly rounded (round-half-to-even), so mixing a big
// integer into double arithmetic behaves as if the exact value had been
// rounded once to the nearest double.
// -----------------------------------------------------------------------------

// Nearest double to v. Throws BigIntError if v is outside the double range.
double to_double(const Int& v);

// Exact integer value of an integral double. Throws BigIntError on NaN,
// infinity or a fractional value.
Int from_double(double x);

// Nearest double to the exact quotient num / den. Throws BigIntError if den
// is zero.
double ratio_to_double(const Int& num, const Int& den);

// -----------------------------------------------------------------------------
// Rounding
// -----------------------------------------------------------------------------

// Round to the nearest integer; ties go to the even neighbour
// (round(0.5) == 0, round(1.5) == 2, round(-2.5) == -2). Independent of the
// floating-point environment.
double round_half_even(double x);

// round_half_even followed by an exact conversion to Int.
Int round_to_int(double x);

} // namespace bigint

#endif // KEYGATE_CRYPTO_BIGINT_HPP
