#pragma once

#include <cstddef>
#include <functional>
#include <optional>

#include <boost/container_hash/hash.hpp>
#include <fmt/format.h>

#include "Grid.hpp"
#include "Point.hpp"

// a partially drawn pattern: where it ends and which dots are still free
// the visiting order is irrelevant to what can follow
struct PatternState {
    std::optional<Point> last; // empty for the empty pattern
    Grid unused; // never contains last

    // nothing drawn yet on a size x size board
    [[nodiscard]] static PatternState empty(size_t size) {
        return PatternState{ std::nullopt, Grid::square(size) };
    }

    [[nodiscard]] bool operator==(const PatternState &other) const = default;

    // last and unused together
    [[nodiscard]] Grid occupied() const {
        return last ? unused.set(*last) : unused;
    }

    // the move last -> candidate must not jump over an unused dot
    // sight(a, b) yields the dots strictly between a and b
    template <typename Sight>
    [[nodiscard]] bool legal(Point candidate, Sight &&sight) const {
        return !last || !(sight(*last, candidate) & unused);
    }

    [[nodiscard]] bool legal(Point candidate) const;

    // candidate must be unused
    [[nodiscard]] PatternState append(Point candidate) const {
        return PatternState{ candidate, unused.clear(candidate) };
    }

    // applies the same board operation to last and unused
    template <typename F>
    [[nodiscard]] PatternState map(F &&f) const {
        if (!last)
            return PatternState{ std::nullopt, f(unused) };
        return PatternState{ f(Grid{}.set(*last)).front(), f(unused) };
    }
};

template <>
struct fmt::formatter<PatternState> : formatter<string_view> {
    auto format(const PatternState &s, format_context &ctx) const
        -> format_context::iterator;
};

template <>
struct std::hash<PatternState> {
    size_t operator()(const PatternState &s) const noexcept {
        size_t h{};
        boost::hash_combine(h, s.last ? std::hash<Point>{}(*s.last) : ~size_t{});
        boost::hash_combine(h, std::hash<Grid>{}(s.unused));
        return h;
    }
};
