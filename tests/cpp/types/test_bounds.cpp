#include <catch2/catch_test_macros.hpp>

#include <tclinter/types/bounds.h>

#include <cmath>
#include <limits>

using namespace tclinter;

TEST_CASE("Bounds - writes inside the interval succeed, writes outside fail after the write", "[types][bounds]") {
    ReactiveVariable<int64_t> variable{5};
    Bounds<int64_t> bounds{variable, 0, 10};

    variable.set_value(7);
    REQUIRE(variable.value() == 7);

    REQUIRE_THROWS_AS(variable.set_value(15), BoundsViolation);
    REQUIRE(variable.value() == 15);

    for (int64_t v = 0; v <= 10; ++v) {
        REQUIRE_NOTHROW(variable.set_value(v));
        REQUIRE(variable.value() == v);
    }
    for (int64_t v : {-5, -1, 11, 100}) {
        REQUIRE_THROWS_AS(variable.set_value(v), BoundsViolation);
        REQUIRE(variable.value() == v);
    }
}

TEST_CASE("Bounds - an inverted interval is rejected", "[types][bounds]") {
    ReactiveVariable<int64_t> inside{5};
    ReactiveVariable<int64_t> outside{50};

    REQUIRE_THROWS_AS((Bounds<int64_t>{inside, 10, 0}), ValueError);
    REQUIRE_THROWS_AS((Bounds<int64_t>{outside, 10, 0}), ValueError);
    REQUIRE(inside.observers().empty());
    REQUIRE(outside.observers().empty());

    Bounds<int64_t> bounds{inside, 0, 10};
    REQUIRE_THROWS_AS(bounds.set_minimum(11), ValueError);
    REQUIRE_THROWS_AS(bounds.set_maximum(-1), ValueError);
    REQUIRE(*bounds.minimum() == 0);
    REQUIRE(*bounds.maximum() == 10);
}

TEST_CASE("Bounds - construction does not check the current value", "[types][bounds]") {
    ReactiveVariable<int64_t> variable{50};
    Bounds<int64_t> bounds{variable, 0, 10};
    REQUIRE_FALSE(bounds.satisfied());
    REQUIRE(variable.value() == 50);
}

TEST_CASE("Bounds - an unset bound is not enforced", "[types][bounds]") {
    ReactiveVariable<int64_t> variable{0};
    Bounds<int64_t> bounds{variable, std::nullopt, 10};

    REQUIRE_NOTHROW(variable.set_value(-1000));
    REQUIRE_THROWS_AS(variable.set_value(11), BoundsViolation);

    bounds.set_minimum(0);
    REQUIRE_THROWS_AS(variable.set_value(-1), BoundsViolation);
}

TEST_CASE("Bounds - bound types must match the value", "[types][bounds]") {
    Variable variable{Value{int64_t{5}}};

    REQUIRE_THROWS_AS((Bounds<Value>{variable, Value{0.0}, Value{10.0}}), TypeError);
    REQUIRE(variable.observers().empty());

    Bounds<Value> bounds{variable, Value{int64_t{0}}, Value{int64_t{10}}};
    REQUIRE_NOTHROW(variable.set_value(int64_t{3}));
    REQUIRE_THROWS_AS(variable.set_value(int64_t{12}), BoundsViolation);
    REQUIRE_THROWS_AS(variable.set_value(std::string{"text"}), TypeError);
}

TEST_CASE("Bounds - NaN is outside every interval", "[types][bounds]") {
    const auto nan = std::numeric_limits<double>::quiet_NaN();

    SECTION("a plain double") {
        ReactiveVariable<double> variable{5.0};
        Bounds<double> bounds{variable, 0.0, 10.0};

        REQUIRE_THROWS_AS(variable.set_value(nan), BoundsViolation);
        REQUIRE_FALSE(bounds.satisfied());
        REQUIRE_NOTHROW(variable.set_value(10.0));
    }

    SECTION("a double held in a Value") {
        Variable variable{Value{5.0}};
        Bounds<Value> bounds{variable, Value{0.0}, Value{10.0}, ViolationPolicy::rollback};

        REQUIRE_THROWS_AS(variable.set_value(Value{nan}), BoundsViolation);
        REQUIRE(std::get<double>(variable.value()) == 5.0);
    }

    SECTION("only one bound set") {
        ReactiveVariable<double> variable{5.0};
        Bounds<double> bounds{variable, std::nullopt, 10.0};

        REQUIRE_THROWS_AS(variable.set_value(nan), BoundsViolation);
        REQUIRE(std::isnan(variable.value()));
    }
}

TEST_CASE("Bounds - rollback restores the last value inside the interval", "[types][bounds]") {
    ReactiveVariable<int64_t> variable{5};
    Bounds<int64_t> bounds{variable, 0, 10, ViolationPolicy::rollback};

    variable.set_value(8);
    REQUIRE_THROWS_AS(variable.set_value(20), BoundsViolation);
    REQUIRE(variable.value() == 8);
    REQUIRE(bounds.policy() == ViolationPolicy::rollback);
}

TEST_CASE("Bounds - the observer goes with the constraint", "[types][bounds]") {
    ReactiveVariable<int64_t> variable{5};
    {
        Bounds<int64_t> bounds{variable, 0, 10};
        REQUIRE(variable.observers().contains(bounds.observer_key()));
        REQUIRE(&bounds.enforces() == &variable);
    }
    REQUIRE(variable.observers().empty());
    REQUIRE_NOTHROW(variable.set_value(100));
}
