// dexcore - Fixed-point arithmetic tests

#include <catch2/catch.hpp>
#include <dexcore/math.hpp>

#include <limits>

#include "memory_ledger.hpp"

using namespace dexcore;
using namespace dexcore::amm_math;
using dexcore::testing::error_of;

namespace {

constexpr Amount MAX = std::numeric_limits<Amount>::max();

} // anonymous namespace

TEST_CASE("Checked add and subtract", "[math]") {
    REQUIRE(checked_add(1, 2) == 3);
    REQUIRE(checked_add(MAX - 1, 1) == MAX);
    REQUIRE(checked_sub(5, 5) == 0);

    REQUIRE(error_of([] { checked_add(MAX, 1); }) == Error::ARITHMETIC_ERROR);
    REQUIRE(error_of([] { checked_sub(1, 2); }) == Error::ARITHMETIC_ERROR);
}

TEST_CASE("mul_div rounds down and keeps products wide", "[math]") {
    SECTION("Floor division") {
        REQUIRE(mul_div(10, 3, 4) == 7);
        REQUIRE(mul_div(1100, 500, 1000) == 550);
        REQUIRE(mul_div(910, 500, 1000) == 455);
    }

    SECTION("Product beyond 64 bits") {
        REQUIRE(mul_div(MAX, MAX, MAX) == MAX);
        REQUIRE(mul_div(MAX, 4, 8) == MAX / 2);
    }

    SECTION("Division by zero") {
        REQUIRE(error_of([] { mul_div(1, 1, 0); }) == Error::ARITHMETIC_ERROR);
    }

    SECTION("Result too wide") {
        REQUIRE(error_of([] { mul_div(MAX, 2, 1); }) == Error::ARITHMETIC_ERROR);
    }
}

TEST_CASE("Integer square root", "[math]") {
    REQUIRE(isqrt(0) == 0);
    REQUIRE(isqrt(1) == 1);
    REQUIRE(isqrt(3) == 1);
    REQUIRE(isqrt(4) == 2);
    REQUIRE(isqrt(1000000) == 1000);
    REQUIRE(isqrt(999999) == 999);

    SECTION("Floor property over a range") {
        for (U128 x = 0; x < 5000; ++x) {
            U128 r = isqrt(x);
            REQUIRE((r * r <= x));
            REQUIRE(((r + 1) * (r + 1) > x));
        }
    }

    SECTION("Full-width product") {
        REQUIRE(sqrt_product(MAX, MAX) == MAX);
        REQUIRE(sqrt_product(1000, 1000) == 1000);
        REQUIRE(sqrt_product(100, 400) == 200);
        REQUIRE(sqrt_product(1000, 1) == 31);
    }
}

TEST_CASE("Input fee", "[math]") {
    FeeRate fee;  // 100 / 10000

    REQUIRE(amount_in_after_fee(100, fee) == 99);
    REQUIRE(amount_in_after_fee(1, fee) == 0);
    REQUIRE(amount_in_after_fee(100, FeeRate{0, 10000}) == 100);

    REQUIRE(error_of([] { amount_in_after_fee(100, FeeRate{10000, 10000}); }) ==
            Error::ARITHMETIC_ERROR);
}

TEST_CASE("Constant product output", "[math]") {
    FeeRate fee;

    SECTION("Standard swap") {
        // in_after_fee = 99, out = floor(1000 * 99 / 1099)
        REQUIRE(get_output_amount(100, 1000, 1000, fee) == 90);
    }

    SECTION("Fee-free output is never smaller") {
        REQUIRE(get_output_amount_no_fee(100, 1000, 1000) == 90);
        REQUIRE(get_output_amount_no_fee(1000, 1000, 1000) == 500);
        REQUIRE(get_output_amount(1000, 1000, 1000, fee) <=
                get_output_amount_no_fee(1000, 1000, 1000));
    }

    SECTION("Output stays below the reserve") {
        REQUIRE(get_output_amount(MAX - 1000, 1000, 1000, fee) < 1000);
    }

    SECTION("Empty reserve") {
        REQUIRE(error_of([&] { get_output_amount(100, 0, 1000, fee); }) ==
                Error::INSUFFICIENT_LIQUIDITY);
        REQUIRE(error_of([] { get_output_amount_no_fee(100, 1000, 0); }) ==
                Error::INSUFFICIENT_LIQUIDITY);
    }
}
