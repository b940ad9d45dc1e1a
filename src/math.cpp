// =============================================================================
// math.cpp - Checked U128 arithmetic with 256-bit intermediates
// =============================================================================

#include "launchpad/math.hpp"
#include "launchpad/errors.hpp"
#include <algorithm>

namespace launchpad {
namespace math {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;
constexpr U128 U128_MAX = ~U128(0);

inline bool bit_at(const U256& v, int i) {
    return i >= 128 ? ((v.hi >> (i - 128)) & 1) != 0
                    : ((v.lo >> i) & 1) != 0;
}

} // anonymous namespace

// =============================================================================
// Wide Multiply / Divide
// =============================================================================

U256 mul_wide(U128 a, U128 b) {
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate the middle limbs with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);
    return result;
}

DivMod div_mod(const U256& num, U128 denom) {
    if (denom == 0) {
        throw ArithmeticError("division by zero", errors::DIVISION_BY_ZERO);
    }
    if (num.hi == 0) {
        return {num.lo / denom, num.lo % denom};
    }
    if (num.hi >= denom) {
        // Quotient needs more than 128 bits
        throw ArithmeticError("mul_div quotient overflows 128 bits");
    }

    // Restoring long division; the remainder stays below denom so only
    // the bit shifted out of the top needs tracking.
    U128 rem = 0;
    U128 quot = 0;
    for (int i = 255; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | (bit_at(num, i) ? 1 : 0);
        if (carry || rem >= denom) {
            rem -= denom;  // wraps back into range when carry is set
            if (i < 128) quot |= U128(1) << i;
        }
    }
    return {quot, rem};
}

// =============================================================================
// Checked Operations
// =============================================================================

U128 mul_div(U128 a, U128 b, U128 denom) {
    return div_mod(mul_wide(a, b), denom).quotient;
}

U128 mul_div_up(U128 a, U128 b, U128 denom) {
    DivMod r = div_mod(mul_wide(a, b), denom);
    if (r.remainder != 0) {
        if (r.quotient == U128_MAX) {
            throw ArithmeticError("mul_div_up quotient overflows 128 bits");
        }
        r.quotient += 1;
    }
    return r.quotient;
}

U128 ceil_div(U128 a, U128 b) {
    if (b == 0) {
        throw ArithmeticError("division by zero", errors::DIVISION_BY_ZERO);
    }
    return a / b + (a % b != 0 ? 1 : 0);
}

U128 checked_add(U128 a, U128 b) {
    if (a > U128_MAX - b) {
        throw ArithmeticError("u128 addition overflow");
    }
    return a + b;
}

U128 checked_sub(U128 a, U128 b) {
    if (b > a) {
        throw ArithmeticError("u128 subtraction underflow", errors::RESERVE_UNDERFLOW);
    }
    return a - b;
}

// =============================================================================
// Decimal Conversion
// =============================================================================

std::string to_string(U128 value) {
    if (value == 0) return "0";
    std::string out;
    while (value != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

U128 parse_u128(std::string_view text) {
    if (text.empty()) {
        throw ValidationError("empty integer literal", errors::INVALID_AMOUNT);
    }
    U128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw ValidationError("invalid digit in integer literal: " + std::string(text),
                                  errors::INVALID_AMOUNT);
        }
        U128 digit = static_cast<U128>(c - '0');
        if (value > (U128_MAX - digit) / 10) {
            throw ValidationError("integer literal exceeds 128 bits: " + std::string(text),
                                  errors::INVALID_AMOUNT);
        }
        value = value * 10 + digit;
    }
    return value;
}

std::string format_units(U128 value, unsigned decimals) {
    std::string digits = to_string(value);
    if (decimals == 0) return digits;
    if (digits.size() <= decimals) {
        digits.insert(0, decimals - digits.size() + 1, '0');
    }
    std::string whole = digits.substr(0, digits.size() - decimals);
    std::string frac = digits.substr(digits.size() - decimals);
    while (!frac.empty() && frac.back() == '0') frac.pop_back();
    return frac.empty() ? whole : whole + "." + frac;
}

} // namespace math
} // namespace launchpad
