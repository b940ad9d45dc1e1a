// Launchpad - Checked Arithmetic Tests

#include <catch2/catch_test_macros.hpp>
#include <launchpad/errors.hpp>
#include <launchpad/math.hpp>

using namespace launchpad;
using namespace launchpad::math;

TEST_CASE("mul_div keeps 256-bit intermediates", "[math]") {
    SECTION("Small operands") {
        REQUIRE(mul_div(6, 7, 3) == 14);
        REQUIRE(mul_div(10, 10, 3) == 33);
    }

    SECTION("Product wider than 128 bits") {
        U128 big = static_cast<U128>(800000000ULL) * WAD;  // 8e26
        // 8e26 * 8e26 overflows u128 but the quotient fits
        REQUIRE(mul_div(big, big, big) == big);
        REQUIRE(mul_div(big, WAD, WAD) == big);
    }

    SECTION("Quotient overflow throws") {
        U128 max = ~U128(0);
        REQUIRE_THROWS_AS(mul_div(max, 2, 1), ArithmeticError);
    }

    SECTION("Zero divisor throws") {
        try {
            mul_div(1, 1, 0);
            FAIL("expected ArithmeticError");
        } catch (const ArithmeticError& e) {
            REQUIRE(e.code() == errors::DIVISION_BY_ZERO);
        }
    }
}

TEST_CASE("mul_div_up rounds toward positive infinity", "[math]") {
    REQUIRE(mul_div_up(10, 10, 3) == 34);
    REQUIRE(mul_div_up(9, 1, 3) == 3);
    REQUIRE(mul_div_up(0, 5, 7) == 0);
    REQUIRE(ceil_div(7, 2) == 4);
    REQUIRE(ceil_div(8, 2) == 4);
    REQUIRE_THROWS_AS(ceil_div(1, 0), ArithmeticError);
}

TEST_CASE("checked add and sub", "[math]") {
    U128 max = ~U128(0);
    REQUIRE(checked_add(1, 2) == 3);
    REQUIRE_THROWS_AS(checked_add(max, 1), ArithmeticError);
    REQUIRE(checked_sub(5, 5) == 0);

    try {
        checked_sub(1, 2);
        FAIL("expected ArithmeticError");
    } catch (const ArithmeticError& e) {
        REQUIRE(e.code() == errors::RESERVE_UNDERFLOW);
    }
}

TEST_CASE("Decimal conversion", "[math]") {
    SECTION("to_string") {
        REQUIRE(to_string(0) == "0");
        REQUIRE(to_string(WAD) == "1000000000000000000");
        REQUIRE(to_string(~U128(0)) == "340282366920938463463374607431768211455");
    }

    SECTION("parse_u128") {
        REQUIRE(parse_u128("1000000000000000000") == WAD);
        REQUIRE(parse_u128("340282366920938463463374607431768211455") == ~U128(0));
        REQUIRE_THROWS_AS(parse_u128(""), ValidationError);
        REQUIRE_THROWS_AS(parse_u128("12a"), ValidationError);
        REQUIRE_THROWS_AS(parse_u128("-1"), ValidationError);
        REQUIRE_THROWS_AS(parse_u128("340282366920938463463374607431768211456"), ValidationError);
    }

    SECTION("format_units") {
        REQUIRE(format_units(WAD) == "1");
        REQUIRE(format_units(WAD / 100) == "0.01");
        REQUIRE(format_units(1) == "0.000000000000000001");
        REQUIRE(format_units(15 * WAD / 10) == "1.5");
        REQUIRE(format_units(1234, 0) == "1234");
    }
}
