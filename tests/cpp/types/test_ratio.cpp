#include <catch2/catch_test_macros.hpp>

#include <tclinter/types/ratio.h>

using namespace tclinter;

TEST_CASE("Ratio - reduces lazily", "[types][ratio]") {
    Ratio<> ratio{4, 6};
    REQUIRE_FALSE(ratio.reduced());
    REQUIRE(ratio.numerator() == 4);

    REQUIRE(ratio.ratio() == std::pair<int64_t, int64_t>{2, 3});
    REQUIRE(ratio.reduced());
    REQUIRE(ratio.numerator() == 2);
    REQUIRE(ratio.denominator() == 3);
}

TEST_CASE("Ratio - writes clear the reduced flag only when the value changes", "[types][ratio]") {
    Ratio<int> ratio{3, 9};
    ratio.reduce();
    REQUIRE(ratio.reduced());

    ratio.set_numerator(1);
    REQUIRE(ratio.reduced());

    ratio.set_denominator(6);
    REQUIRE_FALSE(ratio.reduced());
    ratio.set_numerator(4);
    REQUIRE(ratio.ratio() == std::pair<int, int>{2, 3});
}

TEST_CASE("Ratio - edge cases", "[types][ratio]") {
    Ratio<> defaulted;
    REQUIRE(defaulted.ratio() == std::pair<int64_t, int64_t>{1, 1});

    Ratio<> zero{0, 5};
    REQUIRE(zero.ratio() == std::pair<int64_t, int64_t>{0, 1});

    Ratio<> undefined{0, 0};
    REQUIRE_THROWS_AS(undefined.reduce(), ValueError);
}
