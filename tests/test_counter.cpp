#include <doctest/doctest.h>

#include <cstdint>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <vector>

#include "counter.hpp"

TEST_CASE("the classic 3x3 unlock screen")
{
    CHECK(count_valid_patterns(3, 4) == 389112);
}

TEST_CASE("3x3 patterns by exact length")
{
    auto exact = count_by_length(3);
    std::vector<int64_t> expected{ 1, 9, 56, 320, 1624, 7152, 26016, 72912, 140704, 140704 };
    CHECK(exact == expected);

    auto total = std::accumulate(exact.begin() + 1, exact.end(), int64_t{});
    CHECK(total == count_valid_patterns(3, 1));
    CHECK(count_valid_patterns(3, 1) == 389497);
}

TEST_CASE("min_length <= 0 also counts the empty pattern")
{
    CHECK(count_valid_patterns(3, 0) == 389498);
    CHECK(count_valid_patterns(3, -5) == 389498);
    CHECK(count_valid_patterns(1, 0) == 2);
    CHECK(count_valid_patterns(1, 1) == 1);
}

TEST_CASE("the 0x0 board has only the empty pattern")
{
    CHECK(count_valid_patterns(0, 0) == 1);
    CHECK(count_valid_patterns(0, -1) == 1);
    CHECK(count_valid_patterns(0, 1) == 0);
    CHECK(count_naive(0, 0) == 1);
}

TEST_CASE("min_length beyond the board yields nothing")
{
    for (auto n = 0; n <= 4; n++) {
        CHECK(count_valid_patterns(n, n * n + 1) == 0);
        CHECK(count_naive(n, n * n + 1) == 0);
    }
    CHECK(count_valid_patterns(8, 65) == 0);
}

TEST_CASE("every move is legal on a 2x2 board")
{
    // 4 + 4*3 + 4*3*2 + 4*3*2*1
    CHECK(count_valid_patterns(2, 1) == 64);
    CHECK(count_valid_patterns(2, 4) == 24);
}

TEST_CASE("memoized counts agree with the exhaustive search")
{
    for (auto n = 1; n <= 3; n++)
        for (auto k : { -1, 0, 1, 2, 4, 9 }) {
            CAPTURE(n);
            CAPTURE(k);
            CHECK(count_valid_patterns(n, k) == count_naive(n, k));
        }
}

TEST_CASE("symmetry reduction does not change 4x4 counts")
{
    CountOptions raw;
    raw.reduce = false;
    CHECK(count_valid_patterns(4, 4) == count_valid_patterns(4, 4, raw));
    CHECK(count_valid_patterns(4, 15) == count_valid_patterns(4, 15, raw));
}

TEST_CASE("symmetry reduction shrinks the cache")
{
    CountOptions raw;
    raw.reduce = false;
    Counter reduced, plain{ raw };
    auto a = reduced.count(PatternState::empty(4), 0, 1);
    auto b = plain.count(PatternState::empty(4), 0, 1);
    CHECK(a == b);
    CHECK(reduced.states() * 2 < plain.states());
}

TEST_CASE("loosening min_length never lowers the count")
{
    auto exact = count_by_length(4);
    REQUIRE(exact.size() == 17);
    for (auto v : exact)
        CHECK(v >= 0);
    CHECK(exact[0] == 1);
    CHECK(exact[1] == 16);
    auto at_least_1 = count_valid_patterns(4, 1);
    for (auto k = 1; k <= 16; k++)
        CHECK(at_least_1 >= count_valid_patterns(4, k));
}

TEST_CASE("Counter reuses its cache across calls")
{
    Counter counter;
    auto first = counter.count(PatternState::empty(3), 0, 4);
    auto states = counter.states();
    CHECK(counter.count(PatternState::empty(3), 0, 4) == first);
    CHECK(counter.states() == states);
    // a symmetric start hits the same entries
    CHECK(counter.count(PatternState::empty(3).append({ 2, 2 }), 1, 4)
            == counter.count(PatternState::empty(3).append({ 0, 0 }), 1, 4));
}

TEST_CASE("Context interns points and caches lines of sight")
{
    Context ctx;
    CHECK(&ctx.point(1, 2) == &ctx.point(1, 2));
    CHECK(&ctx.point(1, 2) != &ctx.point(2, 1));
    CHECK(ctx.points.size() == 2);

    CHECK(ctx.between({ 0, 0 }, { 0, 2 }) == Grid{}.set(0, 1));
    CHECK(ctx.between({ 0, 2 }, { 0, 0 }) == Grid{}.set(0, 1));
    CHECK(ctx.sight.size() == 1);
}

TEST_CASE("overflow is reported, not wrapped")
{
    constexpr auto max = std::numeric_limits<int64_t>::max();
    CHECK(checked_add(1, 2) == 3);
    CHECK(checked_add(max - 1, 1) == max);
    CHECK_THROWS_AS((void)checked_add(max, 1), std::overflow_error);
    CHECK_THROWS_AS((void)checked_add(max / 2 + 1, max / 2 + 1), std::overflow_error);
    CHECK(checked_add(40, 60, 100) == 100);
    CHECK_THROWS_AS((void)checked_add(40, 61, 100), std::overflow_error);
}

TEST_CASE("overflow escapes the recursion")
{
    // every partial sum stays below the final total
    CountOptions capped;
    capped.limit = 389112;
    CHECK(count_valid_patterns(3, 4, capped) == 389112);

    capped.limit = 389111;
    CHECK_THROWS_AS((void)count_valid_patterns(3, 4, capped), std::overflow_error);

    capped.limit = 1000;
    Counter counter{ capped };
    CHECK_THROWS_AS((void)counter.count(PatternState::empty(3), 0, 1), std::overflow_error);
    CHECK_THROWS_AS((void)count_by_length(3, capped), std::overflow_error);
}

TEST_CASE("count_valid_patterns can share a Counter")
{
    Counter counter;
    CHECK(count_valid_patterns(counter, 3, 4) == 389112);
    auto states = counter.states();
    CHECK(states > 0);
    CHECK(count_valid_patterns(counter, 3, 4) == 389112);
    CHECK(counter.states() == states);
    CHECK(count_valid_patterns(counter, 3, 10) == 0);
    CHECK(counter.states() == states);
    CHECK_THROWS_AS((void)count_valid_patterns(counter, 9, 4), std::out_of_range);
}

TEST_CASE("board sizes are validated")
{
    CHECK_THROWS_AS(validate_size(-1), std::invalid_argument);
    CHECK_THROWS_AS(validate_size(9), std::out_of_range);
    CHECK_NOTHROW(validate_size(0));
    CHECK_NOTHROW(validate_size(8));
    CHECK_THROWS_AS((void)count_valid_patterns(-2, 4), std::invalid_argument);
    CHECK_THROWS_AS((void)count_naive(9, 4), std::out_of_range);
}
