#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <tuple>
#include <utility>
#include <vector>

#include "Cache.hpp"
#include "Grid.hpp"
#include "PatternState.hpp"
#include "Point.hpp"

// lookups shared by one counting run
struct Context {
    Cache<std::pair<int, int>, Point> points;
    Cache<std::pair<Point, Point>, Grid> sight;

    // the single stored instance for (row, col)
    // PatternState copies Points by value, so nothing relies on the identity
    [[nodiscard]] const Point &point(int row, int col);

    // ::between(a, b), cached under the ordered pair
    [[nodiscard]] Grid between(Point a, Point b);
};

struct CountOptions {
    bool reduce{ true }; // memoize on simplify(state) instead of the raw state
    uint64_t report{}; // progress line on stderr every `report` new states; 0 = silent
    int64_t limit{ std::numeric_limits<int64_t>::max() }; // largest count that is not an overflow
};

// NOT thread-safe at all!
class Counter {
    CountOptions options;
    Context ctx;
    Cache<std::tuple<PatternState, int, int>, int64_t> memo;

public:
    explicit Counter(CountOptions opts = {}) : options{ opts } { }

    // number of ways to continue state (already `length` dots long), counting
    // every prefix of at least min_length dots once, state itself included
    // throws std::overflow_error if the count exceeds options.limit
    [[nodiscard]] int64_t count(const PatternState &state, int length, int min_length);

    [[nodiscard]] const Context &context() const { return ctx; }
    [[nodiscard]] size_t states() const { return memo.size(); }
    [[nodiscard]] size_t bytes() const {
        return memo.bytes() + ctx.points.bytes() + ctx.sight.bytes();
    }
};

// a + b for non-negative counts; throws std::overflow_error instead of going past limit
[[nodiscard]] int64_t checked_add(int64_t a, int64_t b,
        int64_t limit = std::numeric_limits<int64_t>::max());

// throws std::invalid_argument if size < 0
// throws std::out_of_range if size does not fit in a Grid
void validate_size(int size);

// legal patterns with at least min_length dots on a size x size board
// min_length <= 0 also counts the empty pattern
[[nodiscard]] int64_t count_valid_patterns(int size, int min_length, CountOptions opts = {});

// same, on the caches of an existing counter
[[nodiscard]] int64_t count_valid_patterns(Counter &counter, int size, int min_length);

// [k] = legal patterns with exactly k dots, k = 0 ... size * size
[[nodiscard]] std::vector<int64_t> count_by_length(int size, CountOptions opts = {});

// exhaustive search without any cache, same results as count_valid_patterns
[[nodiscard]] int64_t count_naive(int size, int min_length);
