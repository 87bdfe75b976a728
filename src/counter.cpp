#include "counter.hpp"

#include <algorithm>
#include <cstdio>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

#include "canonical.hpp"
#include "sight.hpp"
#include "util.hpp"

const Point &Context::point(int row, int col) {
    return points.get_or_compute({ row, col }, [=] { return Point{ row, col }; });
}

Grid Context::between(Point a, Point b) {
    auto key = a < b ? std::make_pair(a, b) : std::make_pair(b, a);
    return sight.get_or_compute(key, [=] { return ::between(key.first, key.second); });
}

int64_t Counter::count(const PatternState &state, int length, int min_length) {
    auto key = std::make_tuple(options.reduce ? simplify(state) : state, length, min_length);
    auto before = memo.size();
    auto res = memo.get_or_compute(key, [&] {
        const auto &s = std::get<0>(key);
        auto total = int64_t{ length >= min_length };
        for (auto [row, col] : s.unused) {
            const auto &p = ctx.point(row, col);
            if (!s.legal(p, [this](Point a, Point b) { return ctx.between(a, b); }))
                continue;
            total = checked_add(total, count(s.append(p), length + 1, min_length), options.limit);
        }
        return total;
    });
    if (options.report && memo.size() != before && !(memo.size() % options.report))
        fmt::print(stderr, "{} states ({}B), {} sight lines\n",
                memo.size(), display(bytes()), ctx.sight.size());
    return res;
}

int64_t checked_add(int64_t a, int64_t b, int64_t limit) {
    if (b > limit - a)
        throw std::overflow_error{ fmt::format("pattern count exceeds {}: {} + {}", limit, a, b) };
    return a + b;
}

void validate_size(int size) {
    if (size < 0)
        throw std::invalid_argument{ fmt::format("negative grid size {}", size) };
    if (static_cast<size_t>(size) > Grid::LEN)
        throw std::out_of_range{ fmt::format("grid size {} exceeds {}", size, Grid::LEN) };
}

int64_t count_valid_patterns(int size, int min_length, CountOptions opts) {
    Counter counter{ opts };
    return count_valid_patterns(counter, size, min_length);
}

int64_t count_valid_patterns(Counter &counter, int size, int min_length) {
    validate_size(size);
    if (min_length > size * size)
        return 0;
    return counter.count(PatternState::empty(size), 0, min_length);
}

std::vector<int64_t> count_by_length(int size, CountOptions opts) {
    validate_size(size);
    auto n = size * size;
    Counter counter{ opts };
    std::vector<int64_t> at_least(n + 2, 0);
    for (auto k = 0; k <= n; k++)
        at_least[k] = counter.count(PatternState::empty(size), 0, k);
    std::vector<int64_t> exact(n + 1, 0);
    for (auto k = 0; k <= n; k++)
        exact[k] = at_least[k] - at_least[k + 1];
    return exact;
}

int64_t count_naive(int size, int min_length) {
    validate_size(size);
    if (min_length > size * size)
        return 0;
    auto f = [=](auto &&self, const PatternState &s, int length) -> int64_t {
        auto total = int64_t{ length >= min_length };
        for (auto p : s.unused)
            if (s.legal(p))
                total = checked_add(total, self(self, s.append(p), length + 1));
        return total;
    };
    return f(f, PatternState::empty(size), 0);
}
