#include <doctest/doctest.h>

#include <fmt/format.h>

#include "PatternState.hpp"

TEST_CASE("PatternState::empty has every dot unused")
{
    auto s = PatternState::empty(3);
    CHECK_FALSE(s.last.has_value());
    CHECK(s.unused == Grid::square(3));
    CHECK(s.occupied() == Grid::square(3));
    for (auto p : s.unused)
        CHECK(s.legal(p));
}

TEST_CASE("PatternState::append moves one dot from unused to last")
{
    auto s = PatternState::empty(3).append({ 1, 1 });
    REQUIRE(s.last.has_value());
    CHECK(*s.last == Point{ 1, 1 });
    CHECK(s.unused.size() == 8);
    CHECK_FALSE(s.unused.test(1, 1));
    CHECK(s.occupied() == Grid::square(3));

    auto t = s.append({ 0, 0 });
    CHECK(*t.last == Point{ 0, 0 });
    CHECK(t.unused.size() == 7);
    // the source is untouched
    CHECK(s.unused.size() == 8);
}

TEST_CASE("PatternState::legal forbids jumping over unused dots")
{
    auto s = PatternState::empty(3).append({ 0, 0 });
    CHECK_FALSE(s.legal({ 0, 2 }));
    CHECK_FALSE(s.legal({ 2, 0 }));
    CHECK_FALSE(s.legal({ 2, 2 }));
    CHECK(s.legal({ 0, 1 }));
    CHECK(s.legal({ 1, 1 }));
    CHECK(s.legal({ 1, 2 }));
    CHECK(s.legal({ 2, 1 }));

    // once (0|1) is used, (0|0) -> (0|2) passes over a visited dot
    auto t = PatternState{ Point{ 0, 0 }, Grid::square(3).clear(0, 0).clear(0, 1) };
    CHECK(t.legal({ 0, 2 }));
    CHECK_FALSE(t.legal({ 2, 2 }));
}

TEST_CASE("PatternState::legal consults the given line of sight")
{
    auto calls = 0;
    auto sight = [&](Point, Point) { calls++; return Grid{}.set(2, 2); };
    auto s = PatternState::empty(3).append({ 0, 0 });
    CHECK_FALSE(s.legal({ 0, 1 }, sight));
    CHECK(calls == 1);
    CHECK(PatternState::empty(3).legal({ 0, 1 }, sight));
    CHECK(calls == 1);
}

TEST_CASE("PatternState::map applies to last and unused alike")
{
    auto s = PatternState{ Point{ 0, 2 }, Grid{}.set(1, 0) };
    auto t = s.map([](Grid g) { return g.transpose(); });
    CHECK(*t.last == Point{ 2, 0 });
    CHECK(t.unused == Grid{}.set(0, 1));
}

TEST_CASE("PatternState equality and formatting")
{
    auto a = PatternState::empty(2).append({ 0, 1 });
    auto b = PatternState{ Point{ 0, 1 }, Grid{}.set(0, 0).set(1, 0).set(1, 1) };
    CHECK(a == b);
    CHECK(std::hash<PatternState>{}(a) == std::hash<PatternState>{}(b));
    CHECK_FALSE(a == PatternState::empty(2));
    CHECK(fmt::format("{}", a) == "(0|1) -> {(0|0), (1|0), (1|1)}");
    CHECK(fmt::format("{}", PatternState{ std::nullopt, Grid{}.set(0, 0) }) == "() -> {(0|0)}");
}
