#ifndef CLUM_FIXED_POINT_HPP
#define CLUM_FIXED_POINT_HPP

#include <string>
#include <string_view>

#include "types.hpp"

namespace clum {

// =============================================================================
// X18 Fixed-Point Arithmetic
// =============================================================================
//
// All routines are deterministic integer algorithms: a proposer and a verifier
// evaluating the same inputs get bit-identical results. Overflow of the I128
// result range throws NumericOverflow; nothing saturates.
//

namespace x18 {

// ln(2) in WAD, truncated (true value 0.693147180559945309417...)
constexpr I128 LN2 = 693147180559945309LL;

// exp() arguments outside [EXP_MIN_ARG, EXP_MAX_ARG]
// (below: result rounds to 0; above: result exceeds I128)
constexpr I128 EXP_MIN_ARG = -42 * X18_ONE;
constexpr I128 EXP_MAX_ARG = 46 * X18_ONE;

// Absolute error bounds (wei) of exp() for arguments <= 0 and of ln().
// Both include the truncation of every series term and of the LN2 constant.
constexpr I128 EXP_MAX_ERROR = 512;
constexpr I128 LN_MAX_ERROR = 512;

// a * b / d with a 256-bit intermediate, rounded toward zero
I128 mul_div(I128 a, I128 b, I128 d);

// a * b / d rounded away from zero
I128 mul_div_up(I128 a, I128 b, I128 d);

// a * b / 1e18
inline I128 mul(I128 a, I128 b) { return mul_div(a, b, X18_ONE); }
inline I128 mul_up(I128 a, I128 b) { return mul_div_up(a, b, X18_ONE); }

// a * b / 1e18 rounded toward -inf / +inf (interval bounds)
inline I128 mul_floor(I128 a, I128 b) {
    return ((a < 0) != (b < 0)) ? mul_up(a, b) : mul(a, b);
}
inline I128 mul_ceil(I128 a, I128 b) {
    return ((a < 0) != (b < 0)) ? mul(a, b) : mul_up(a, b);
}

// a * 1e18 / b
inline I128 div(I128 a, I128 b) { return mul_div(a, X18_ONE, b); }
inline I128 div_up(I128 a, I128 b) { return mul_div_up(a, X18_ONE, b); }

// Checked addition / subtraction
I128 add(I128 a, I128 b);
I128 sub(I128 a, I128 b);

// e^x in WAD
I128 exp(I128 x);

// Natural log in WAD; x must be positive
I128 ln(I128 x);

inline I128 abs(I128 x) { return x < 0 ? -x : x; }

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline int64_t to_int(I128 v) {
    return static_cast<int64_t>(v / X18_ONE);
}

inline I128 from_double(double v) {
    return static_cast<I128>(v * static_cast<double>(X18_ONE));
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

// WAD -> USDC (6dp), truncated toward zero
inline I128 to_usdc(I128 v) { return v / X18_PER_USDC; }
inline I128 from_usdc(I128 v) { return v * X18_PER_USDC; }

// Exact decimal conversions ("2000", "-0.25", "1e-3" is not accepted).
// Digits beyond the 18th fractional place are truncated.
I128 from_string(std::string_view s);
std::string to_string(I128 v);

// Plain integer rendering of a raw I128
std::string raw_to_string(I128 v);

} // namespace x18

} // namespace clum

#endif // CLUM_FIXED_POINT_HPP
