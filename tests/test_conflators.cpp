/**
 * @file test_conflators.cpp
 * @brief End-to-end behaviour of each ready-made conflator across intervals.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/catch_template_test_macros.hpp>

#include <conflate/conflators.h>

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <string>
#include <vector>

using namespace conflate;

// ============================================================================
// Interval semantics common to every conflator
// ============================================================================

TEMPLATE_TEST_CASE("Conflators - reset clears the dirty set", "[conflator][reset]",
                   (ConflatedDict<int, int>), (OHLCConflator<int, int>), (MeanConflator<int, int>),
                   (BatchConflator<int, int>), (ModeConflator<int, int>)) {
    TestType c;
    for (int i = 0; i < 5; ++i) {
        c.set(i % 3, i);
    }
    REQUIRE(c.size() == 3);
    c.reset();
    CHECK(c.size() == 0);
    CHECK(c.data().size() == 3);
    for (int key = 0; key < 3; ++key) {
        REQUIRE_THROWS_AS(c.get(key), key_not_dirty);
    }
}

// ============================================================================
// OHLCConflator
// ============================================================================

TEST_CASE("OHLCConflator - open high low close", "[conflator][ohlc]") {
    OHLCConflator<int, int> c;
    for (int i = 0; i < 5; ++i) c.set(1, i);
    CHECK(c.get(1) == Ohlc<int>{0, 4, 0, 4});

    SECTION("new high") {
        c.set(1, 5);
        CHECK(c.get(1) == Ohlc<int>{0, 5, 0, 5});
        c.set(1, -1);
        CHECK(c.get(1) == Ohlc<int>{0, 5, -1, -1});
    }

    SECTION("new low") {
        c.set(1, -1);
        CHECK(c.get(1) == Ohlc<int>{0, 4, -1, -1});
    }

    SECTION("new last") {
        c.set(1, 2);
        CHECK(c.get(1) == Ohlc<int>{0, 4, 0, 2});
    }
}

TEST_CASE("OHLCConflator - summary carries across reset", "[conflator][ohlc]") {
    OHLCConflator<std::string, double> c;
    c.set("AAPL", 100.0);
    c.set("AAPL", 103.0);
    c.reset();
    c.set("AAPL", 99.0);
    CHECK(c.get("AAPL") == Ohlc<double>{100.0, 103.0, 99.0, 99.0});
}

TEST_CASE("OHLCConflator - str", "[conflator][ohlc]") {
    OHLCConflator<int, int> c;
    CHECK(to_string(c) == "<OHLCConflator dirty:0 entries:0>");
}

TEST_CASE("OHLCConflator - AnyValue mismatch leaves the entry untouched", "[conflator][ohlc][throws]") {
    OHLCConflator<std::string> c;
    c.set("x", 1);
    c.set("x", 3);
    c.reset();

    REQUIRE_THROWS_AS(c.set("x", "three"), type_mismatch);
    CHECK_FALSE(c.is_dirty("x"));
    CHECK(c.data().at("x") == Ohlc<AnyValue<>>{1, 3, 1, 3});

    c.set("x", 2);
    CHECK(c.get("x") == Ohlc<AnyValue<>>{1, 3, 1, 2});
}

// ============================================================================
// MeanConflator
// ============================================================================

TEST_CASE("MeanConflator - running mean per interval", "[conflator][mean]") {
    MeanConflator<int, int> c;
    c.set(1, 1);
    CHECK(c.get(1) == Catch::Approx(1.0));
    c.set(1, 2);
    CHECK(c.get(1) == Catch::Approx(1.5));
    c.set(1, 3);
    CHECK(c.get(1) == Catch::Approx(2.0));

    c.reset();
    c.set(1, 5);
    CHECK(c.get(1) == Catch::Approx(5.0));
}

TEST_CASE("MeanConflator - keys are independent", "[conflator][mean]") {
    MeanConflator<std::string, double> c;
    c.set("a", 1.0);
    c.set("b", 10.0);
    c.set("a", 3.0);
    CHECK(c.get("a") == Catch::Approx(2.0));
    CHECK(c.get("b") == Catch::Approx(10.0));
}

TEST_CASE("MeanConflator - AnyValue accepts mixed numbers, rejects text", "[conflator][mean][throws]") {
    MeanConflator<int> c;
    c.set(1, 1);
    c.set(1, 2.5);
    CHECK(c.get(1) == Catch::Approx(1.75));

    REQUIRE_THROWS_AS(c.set(1, "3"), type_mismatch);
    CHECK(c.get(1) == Catch::Approx(1.75));

    REQUIRE_THROWS_AS(c.set(2, "3"), type_mismatch);
    CHECK_FALSE(c.data().contains(2));
    CHECK(c.size() == 1);
}

// ============================================================================
// BatchConflator
// ============================================================================

TEST_CASE("BatchConflator - batches in write order", "[conflator][batch]") {
    BatchConflator<int, int> c;
    for (int i = 0; i < 5; ++i) c.set(1, i);
    CHECK(c.get(1) == std::vector<int>{0, 1, 2, 3, 4});

    c.reset();
    c.set(1, 7);
    CHECK(c.get(1) == std::vector<int>{7});
}

TEST_CASE("BatchConflator - a batch held by the consumer does not change", "[conflator][batch]") {
    BatchConflator<std::string, int> c;
    c.set("k", 1);
    auto held = c.get("k");
    c.set("k", 2);
    CHECK(held == std::vector<int>{1});
    CHECK(c.get("k") == std::vector<int>{1, 2});
}

TEST_CASE("BatchConflator - stale batch stays visible through data()", "[conflator][batch]") {
    BatchConflator<int, int> c;
    c.set(1, 1);
    c.set(1, 2);
    c.reset();
    CHECK(c.data().at(1) == std::vector<int>{1, 2});
    c.set(1, 3);
    CHECK(c.data().at(1) == std::vector<int>{3});
}

// ============================================================================
// ModeConflator
// ============================================================================

TEST_CASE("ModeConflator - most frequent value", "[conflator][mode]") {
    ModeConflator<int, int> c;
    for (int v : {1, 2, 2, 3, 3, 3}) c.set(1, v);
    CHECK(c.get(1) == ModeResult<int>{3, 3});

    for (int v : {1, 1, 1}) c.set(1, v);
    CHECK(c.get(1) == ModeResult<int>{1, 4});
}

TEST_CASE("ModeConflator - counter restarts each interval", "[conflator][mode]") {
    ModeConflator<int, int> c;
    for (int v : {4, 4, 4}) c.set(1, v);
    c.reset();
    c.set(1, 9);
    CHECK(c.get(1) == ModeResult<int>{9, 1});
}

TEST_CASE("ModeConflator - deterministic tie-break", "[conflator][mode]") {
    ModeConflator<std::string> c;
    for (const char* v : {"b", "a", "a", "b"}) c.set("sym", v);
    CHECK(c.get("sym") == ModeResult<AnyValue<>>{"a", 2});
}

// ============================================================================
// LambdaConflator
// ============================================================================

TEST_CASE("LambdaConflator - running total reducer", "[conflator][lambda]") {
    LambdaConflator<int, int> c{ReducerPolicy<int>{[](const int& x, const std::vector<int>& past) {
        return std::accumulate(past.begin(), past.end(), x);
    }}};

    c.set(1, 1);
    CHECK(c.get(1) == 1);
    c.set(1, 2);
    CHECK(c.get(1) == 3);
    c.set(1, 3);
    CHECK(c.get(1) == 6);

    c.reset();
    c.set(1, 1);
    CHECK(c.get(1) == 1);
}

TEST_CASE("LambdaConflator - display name", "[conflator][lambda]") {
    auto max_seen = [](const double& x, const std::vector<double>& past) {
        double m = x;
        for (double p : past) m = std::max(m, p);
        return m;
    };

    LambdaConflator<std::string, double> unnamed{ReducerPolicy<double>{max_seen}};
    CHECK(to_string(unnamed) == "<LambdaConflator dirty:0 entries:0>");

    LambdaConflator<std::string, double> named{ReducerPolicy<double>{max_seen, "MaxConflator"}};
    named.set("a", 1.0);
    named.set("a", 4.0);
    named.set("a", 2.0);
    CHECK(named.get("a") == 4.0);
    CHECK(to_string(named) == "<MaxConflator dirty:1 entries:1>");
}

TEST_CASE("LambdaConflator - AnyValue reducer", "[conflator][lambda][any]") {
    LambdaConflator<std::string> c{ReducerPolicy<AnyValue<>>{
        [](const AnyValue<>&, const std::vector<AnyValue<>>& past) -> AnyValue<> {
            return static_cast<std::int64_t>(past.size()) + 1;
        }}};
    c.set("k", "a");
    c.set("k", 2.0);
    CHECK(c.get("k") == AnyValue<>(2));
}

// ============================================================================
// Erase across conflators
// ============================================================================

TEST_CASE("Conflators - erase drops raw state with the value", "[conflator][erase]") {
    MeanConflator<int, int> c;
    c.set(1, 10);
    c.set(1, 20);
    c.erase(1);
    CHECK_FALSE(c.data().contains(1));
    REQUIRE_THROWS_AS(c.erase(1), key_not_found);

    // Written again the key starts over rather than merging the erased history
    c.set(1, 4);
    CHECK(c.get(1) == Catch::Approx(4.0));
}
