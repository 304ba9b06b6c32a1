#include <catch2/catch_test_macros.hpp>

#include <tclinter/types/reactive_variable.h>

using namespace tclinter;

TEST_CASE("Observers - broadcast reaches every observer once, in insertion order", "[types][observers]") {
    ReactiveVariable<int64_t> variable{0};
    std::vector<std::string> calls;
    for (std::string name : {"c", "a", "b"}) {
        variable.observers().set(name, [&calls, name]() { calls.push_back(name); });
    }

    variable.set_value(3);
    REQUIRE(calls == std::vector<std::string>{"c", "a", "b"});

    variable.set_value(3);
    REQUIRE(calls.size() == 6);
}

TEST_CASE("Observers - results are collected by name", "[types][observers]") {
    Observers<int64_t> observers;
    observers.set("seven", []() -> std::optional<int64_t> { return 7; });
    observers.set("silent", []() {});

    auto results = observers();
    REQUIRE(results.size() == 2);
    REQUIRE(results.at("seven") == 7);
    REQUIRE_FALSE(results.at("silent").has_value());
}

TEST_CASE("Observers - targeted notification", "[types][observers]") {
    Observers<int64_t> observers;
    int a_calls{0};
    int b_calls{0};
    observers.set("a", [&a_calls]() { ++a_calls; });
    observers.set("b", [&b_calls]() { ++b_calls; });

    observers({"b"});
    REQUIRE(a_calls == 0);
    REQUIRE(b_calls == 1);

    SECTION("an unknown name fails before anything runs") {
        REQUIRE_THROWS_AS(observers({"a", "missing"}), LookupError);
        REQUIRE(a_calls == 0);
    }
}

TEST_CASE("Observers - notify_with passes each observer its own arguments", "[types][observers]") {
    Observers<int64_t> observers;
    observers.set("sum", [](std::span<const int64_t> args) -> std::optional<int64_t> {
        int64_t total{0};
        for (auto v : args) { total += v; }
        return total;
    });
    observers.set("count", [](std::span<const int64_t> args) { return static_cast<int64_t>(args.size()); });

    auto results = observers.notify_with({{"sum", {1, 2, 3}}, {"count", {4, 5}}});
    REQUIRE(results.at("sum") == 6);
    REQUIRE(results.at("count") == 2);

    REQUIRE(observers.notify_with("sum", 10) == 10);
    REQUIRE_THROWS_AS(observers.notify_with("missing", 1), LookupError);
}

TEST_CASE("Observers - keys and replacement", "[types][observers]") {
    Observers<int64_t> observers;
    observers.set(42, []() -> std::optional<int64_t> { return 1; });
    REQUIRE(observers.contains("42"));

    observers.set("other", []() {});
    observers.set(42, []() -> std::optional<int64_t> { return 2; });
    REQUIRE(observers.names() == std::vector<std::string>{"42", "other"});
    REQUIRE(observers()["42"] == 2);

    REQUIRE(observers.erase("42"));
    REQUIRE_FALSE(observers.erase("42"));
    REQUIRE(observers.size() == 1);
}

TEST_CASE("Observers - empty callables are rejected", "[types][observers]") {
    Observers<int64_t> observers;
    std::function<void()> empty;
    REQUIRE_THROWS_AS(observers.set("empty", empty), ValueError);
    REQUIRE(observers.empty());
}

TEST_CASE("Observers - the set may change during a broadcast", "[types][observers]") {
    Observers<int64_t> observers;
    int late_calls{0};
    observers.set("first", [&]() {
        observers.erase("second");
        observers.set("late", [&late_calls]() { ++late_calls; });
    });
    observers.set("second", []() {});

    auto results = observers();
    REQUIRE(results.size() == 2);
    REQUIRE(late_calls == 0);
    REQUIRE(observers.names() == std::vector<std::string>{"first", "late"});
}

TEST_CASE("ReactiveVariable - construction", "[types][variable]") {
    ReactiveVariable<std::string> variable{"hello"};
    REQUIRE(variable.value() == "hello");
    REQUIRE(variable.observers().empty());

    auto from_factory = ReactiveVariable<int64_t>::from_default([] { return int64_t{9}; });
    REQUIRE(from_factory.value() == 9);

    REQUIRE_THROWS_AS(ReactiveVariable<int64_t>::from_default({}), ValueError);
}

TEST_CASE("ReactiveVariable - observers read the value already written", "[types][variable]") {
    Variable variable{Value{int64_t{1}}};
    std::vector<Value> seen;
    variable.observers().set("watch", [&]() { seen.push_back(variable.value()); });

    variable.set_value(std::string{"two"});
    variable.set_value(3.0);

    REQUIRE(seen.size() == 2);
    REQUIRE(std::get<std::string>(seen[0]) == "two");
    REQUIRE(std::get<double>(seen[1]) == 3.0);
}
