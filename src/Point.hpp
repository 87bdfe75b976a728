#pragma once

#include <compare>
#include <cstddef>
#include <functional>

#include <boost/container_hash/hash.hpp>
#include <fmt/format.h>

// a dot of the pattern grid
struct Point {
    int row, col;

    constexpr Point(int r, int c) : row{ r }, col{ c } { }

    [[nodiscard]] constexpr bool operator==(const Point &other) const = default;
    [[nodiscard]] constexpr auto operator<=>(const Point &other) const = default;
};

template <>
struct fmt::formatter<Point> : formatter<string_view> {
    auto format(Point p, format_context &ctx) const {
        return formatter<string_view>::format(fmt::format("({}|{})", p.row, p.col), ctx);
    }
};

template <>
struct std::hash<Point> {
    size_t operator()(Point p) const noexcept {
        size_t h{};
        boost::hash_combine(h, p.row);
        boost::hash_combine(h, p.col);
        return h;
    }
};
