#ifndef LAUNCHPAD_MATH_HPP
#define LAUNCHPAD_MATH_HPP

#include <string>
#include <string_view>

#include "types.hpp"

namespace launchpad {
namespace math {

// =============================================================================
// 256-bit Intermediate (two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;
    U128 hi;

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool is_zero() const { return lo == 0 && hi == 0; }
};

// Full 128x128 -> 256 product
U256 mul_wide(U128 a, U128 b);

// Quotient and remainder of a 256-bit value by a 128-bit divisor.
// Throws ArithmeticError on a zero divisor or a quotient wider than 128 bits.
struct DivMod {
    U128 quotient;
    U128 remainder;
};
DivMod div_mod(const U256& num, U128 denom);

// =============================================================================
// Checked Operations (throw ArithmeticError)
// =============================================================================

// floor(a * b / denom)
U128 mul_div(U128 a, U128 b, U128 denom);

// ceil(a * b / denom)
U128 mul_div_up(U128 a, U128 b, U128 denom);

// ceil(a / b)
U128 ceil_div(U128 a, U128 b);

U128 checked_add(U128 a, U128 b);
U128 checked_sub(U128 a, U128 b);

// =============================================================================
// Decimal Conversion
// =============================================================================

std::string to_string(U128 value);

// Base-10 digits only; throws ValidationError on malformed or oversized input
U128 parse_u128(std::string_view text);

// Whole-token rendering, e.g. 7920792.079207920792079208
std::string format_units(U128 value, unsigned decimals = 18);

} // namespace math
} // namespace launchpad

#endif // LAUNCHPAD_MATH_HPP
