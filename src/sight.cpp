#include "sight.hpp"

#include <algorithm>
#include <cstdlib>
#include <numeric>

Grid between(Point a, Point b) {
    Grid res{};
    if (a.col == b.col) {
        for (auto row = std::min(a.row, b.row) + 1; row < std::max(a.row, b.row); row++)
            res = res.set(row, a.col);
        return res;
    }
    if (a.row == b.row) {
        for (auto col = std::min(a.col, b.col) + 1; col < std::max(a.col, b.col); col++)
            res = res.set(a.row, col);
        return res;
    }
    auto dy = b.row - a.row;
    auto dx = b.col - a.col;
    auto g = std::gcd(std::abs(dy), std::abs(dx));
    dy /= g, dx /= g;
    for (auto y = a.row + dy, x = a.col + dx; y != b.row; y += dy, x += dx)
        res = res.set(y, x);
    return res;
}
