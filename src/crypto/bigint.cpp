#include "bigint.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace bigint {

namespace {

// Bits kept in the scaled quotient before the final rounding. Anything
// comfortably above the 53-bit mantissa works.
constexpr int QUOTIENT_BITS = 66;

Int pow2(unsigned n) {
    return bigint::pow(from_int(2), n);
}

// Binary exponent e with 2^(e-1) <= |v| < 2^e, up to one position of slack
// from the rounding in to_double. Only used to size the quotient.
int approx_bit_length(const Int& v) {
    int e = 0;
    std::frexp(to_double(v), &e);
    return e;
}

} // namespace

Int from_int(int64_t v) {
    Int r;
    r.setStr(std::to_string(v), 10);
    return r;
}

std::string to_string(const Int& v) {
    return v.getStr(10);
}

Int pow(const Int& base, unsigned exp) {
    Int result = from_int(1);
    Int b = base;
    while (exp > 0) {
        if (exp & 1u) result = result * b;
        exp >>= 1;
        if (exp > 0) b = b * b;
    }
    return result;
}

Int abs(const Int& v) {
    return v < Int(0) ? Int(0) - v : v;
}

double to_double(const Int& v) {
    // strtod is correctly rounded, which is the rounding we want here.
    const std::string s = v.getStr(10);
    errno = 0;
    double d = std::strtod(s.c_str(), nullptr);
    if (errno == ERANGE || std::isinf(d)) {
        throw BigIntError("Integer too large to convert to double");
    }
    return d;
}

Int from_double(double x) {
    if (!std::isfinite(x)) {
        throw BigIntError("Cannot convert non-finite double to integer");
    }
    if (x != std::trunc(x)) {
        throw BigIntError("Cannot convert fractional double to integer");
    }
    if (x == 0.0) return Int(0);

    bool negative = x < 0;
    int exp = 0;
    double frac = std::frexp(std::fabs(x), &exp);  // frac in [0.5, 1)
    int64_t mantissa = static_cast<int64_t>(std::ldexp(frac, 53));
    exp -= 53;

    Int r = from_int(mantissa);
    if (exp > 0) {
        r = r * pow2(static_cast<unsigned>(exp));
    } else if (exp < 0) {
        // x is integral, so the dropped low bits are all zero
        r = r / pow2(static_cast<unsigned>(-exp));
    }
    return negative ? Int(0) - r : r;
}

double ratio_to_double(const Int& num, const Int& den) {
    if (den == Int(0)) {
        throw BigIntError("Division by zero");
    }
    if (num == Int(0)) return 0.0;

    bool negative = (num < Int(0)) != (den < Int(0));
    Int n = bigint::abs(num);
    Int d = bigint::abs(den);

    // Scale so the integer quotient carries well over 53 significant bits,
    // then fold any non-zero remainder into a sticky low bit. Rounding that
    // integer to a double rounds the exact quotient correctly.
    int shift = QUOTIENT_BITS + approx_bit_length(d) - approx_bit_length(n);
    Int q;
    Int r;
    if (shift >= 0) {
        Int scaled = n * pow2(static_cast<unsigned>(shift));
        q = scaled / d;
        r = scaled % d;
    } else {
        Int scaled_den = d * pow2(static_cast<unsigned>(-shift));
        q = n / scaled_den;
        r = n % scaled_den;
    }
    q = q * Int(2) + (r == Int(0) ? Int(0) : Int(1));
    shift += 1;

    double v = std::ldexp(to_double(q), -shift);
    return negative ? -v : v;
}

double round_half_even(double x) {
    double r = std::floor(x);
    double diff = x - r;
    if (diff > 0.5) return r + 1.0;
    if (diff < 0.5) return r;
    return std::fmod(r, 2.0) == 0.0 ? r : r + 1.0;
}

Int round_to_int(double x) {
    return from_double(round_half_even(x));
}

} // namespace bigint
