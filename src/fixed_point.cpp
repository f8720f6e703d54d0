// =============================================================================
// fixed_point.cpp - Deterministic X18 arithmetic (mul-div, exp, ln, decimal I/O)
// =============================================================================

#include "clum/fixed_point.hpp"
#include <algorithm>
#include <stdexcept>

namespace clum {
namespace x18 {

namespace {

constexpr U128 I128_MAX_MAG = ~U128(0) >> 1;

inline U128 magnitude(I128 v) {
    return v < 0 ? U128(0) - static_cast<U128>(v) : static_cast<U128>(v);
}

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;
    U128 hi;
};

// Multiply two U128 values to produce U256
inline U256 mul_u128(U128 a, U128 b) {
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// Divide U256 by U128. The quotient must fit in 128 bits.
inline U128 div_u256_u128(U256 num, U128 denom, U128& remainder) {
    if (num.hi == 0) {
        remainder = num.lo % denom;
        return num.lo / denom;
    }
    if (num.hi >= denom) {
        throw NumericOverflow("x18::mul_div: quotient exceeds 128 bits");
    }

    // Restoring long division over the low limb; rem < denom throughout
    U128 rem = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        if (carry || rem >= denom) {
            rem -= denom;
            quot |= 1;
        }
    }
    remainder = rem;
    return quot;
}

I128 mul_div_impl(I128 a, I128 b, I128 d, bool away_from_zero) {
    if (d == 0) {
        throw std::domain_error("x18::mul_div: division by zero");
    }
    if (a == 0 || b == 0) return 0;

    bool neg = (a < 0) ^ (b < 0) ^ (d < 0);
    U256 product = mul_u128(magnitude(a), magnitude(b));

    U128 rem = 0;
    U128 quot = div_u256_u128(product, magnitude(d), rem);
    if (away_from_zero && rem != 0) {
        quot += 1;
    }

    if (quot > I128_MAX_MAG) {
        throw NumericOverflow("x18::mul_div: result exceeds I128");
    }
    return neg ? -static_cast<I128>(quot) : static_cast<I128>(quot);
}

} // anonymous namespace

// =============================================================================
// Multiplication / Division
// =============================================================================

I128 mul_div(I128 a, I128 b, I128 d) {
    return mul_div_impl(a, b, d, false);
}

I128 mul_div_up(I128 a, I128 b, I128 d) {
    return mul_div_impl(a, b, d, true);
}

I128 add(I128 a, I128 b) {
    I128 out;
    if (__builtin_add_overflow(a, b, &out)) {
        throw NumericOverflow("x18::add overflow");
    }
    return out;
}

I128 sub(I128 a, I128 b) {
    I128 out;
    if (__builtin_sub_overflow(a, b, &out)) {
        throw NumericOverflow("x18::sub overflow");
    }
    return out;
}

// =============================================================================
// Exponential
// =============================================================================
//
// x = k*ln2 + r with |r| <= ln2/2, e^r by Taylor series, then scaled by 2^k.
//

I128 exp(I128 x) {
    if (x < EXP_MIN_ARG) return 0;
    if (x > EXP_MAX_ARG) {
        throw NumericOverflow("x18::exp: argument too large");
    }

    I128 k = (x >= 0 ? x + LN2 / 2 : x - LN2 / 2) / LN2;
    I128 r = x - k * LN2;

    I128 term = X18_ONE;
    I128 sum = X18_ONE;
    for (int n = 1; n < 64 && term != 0; ++n) {
        term = term * r / (X18_ONE * n);
        sum += term;
    }

    if (k >= 0) {
        return sum * (I128(1) << static_cast<int>(k));
    }
    if (k <= -127) return 0;
    return sum >> static_cast<int>(-k);
}

// =============================================================================
// Natural Logarithm
// =============================================================================
//
// x = m * 2^k with m in [1, 2); ln(m) = 2*atanh((m-1)/(m+1)).
//

I128 ln(I128 x) {
    if (x <= 0) {
        throw std::domain_error("x18::ln: non-positive argument");
    }

    I128 k = 0;
    I128 m = x;
    while (m >= 2 * X18_ONE) {
        m >>= 1;
        ++k;
    }
    while (m < X18_ONE) {
        m <<= 1;
        --k;
    }

    I128 z = (m - X18_ONE) * X18_ONE / (m + X18_ONE);
    I128 z2 = z * z / X18_ONE;

    I128 sum = 0;
    I128 term = z;
    for (int n = 1; term != 0; n += 2) {
        sum += term / n;
        term = term * z2 / X18_ONE;
    }

    return 2 * sum + k * LN2;
}

// =============================================================================
// Decimal Conversion
// =============================================================================

I128 from_string(std::string_view s) {
    if (s.empty()) {
        throw std::invalid_argument("x18::from_string: empty string");
    }

    bool neg = false;
    size_t pos = 0;
    if (s[0] == '-' || s[0] == '+') {
        neg = (s[0] == '-');
        pos = 1;
    }

    auto dot = s.find('.', pos);
    std::string_view int_part = s.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);
    std::string_view frac_part = dot == std::string_view::npos ? std::string_view{} : s.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) {
        throw std::invalid_argument("x18::from_string: no digits in '" + std::string(s) + "'");
    }

    I128 int_val = 0;
    for (char c : int_part) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("x18::from_string: invalid character in '" + std::string(s) + "'");
        }
        if (__builtin_mul_overflow(int_val, I128(10), &int_val) ||
            __builtin_add_overflow(int_val, I128(c - '0'), &int_val)) {
            throw NumericOverflow("x18::from_string: value too large");
        }
    }

    I128 frac_val = 0;
    I128 scale = X18_ONE;
    for (char c : frac_part) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("x18::from_string: invalid character in '" + std::string(s) + "'");
        }
        if (scale > 1) {
            scale /= 10;
            frac_val += I128(c - '0') * scale;
        }
    }

    I128 result;
    if (__builtin_mul_overflow(int_val, X18_ONE, &result) ||
        __builtin_add_overflow(result, frac_val, &result)) {
        throw NumericOverflow("x18::from_string: value too large");
    }
    return neg ? -result : result;
}

std::string raw_to_string(I128 v) {
    if (v == 0) return "0";
    U128 mag = magnitude(v);
    std::string digits;
    while (mag != 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (v < 0) digits.push_back('-');
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string to_string(I128 v) {
    U128 mag = magnitude(v);
    U128 one = static_cast<U128>(X18_ONE);
    U128 int_part = mag / one;
    U128 frac_part = mag % one;

    std::string out = v < 0 ? "-" : "";
    out += raw_to_string(static_cast<I128>(int_part));
    if (frac_part == 0) return out;

    std::string frac = raw_to_string(static_cast<I128>(frac_part));
    frac.insert(0, 18 - frac.size(), '0');
    while (!frac.empty() && frac.back() == '0') frac.pop_back();
    return out + "." + frac;
}

} // namespace x18
} // namespace clum
