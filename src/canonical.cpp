#include "canonical.hpp"

#include <array>
#include <bit>
#include <optional>
#include <tuple>
#include <utility>

// Each rule either rewrites the state or declines. A state is canonical once
// every rule declines:
// 1) the bounding box of {last} + unused starts at (0|0)
// 2) the box is square or landscape
// 3) last lies in the top left quadrant
// 4) in a square box, last lies on or above the diagonal
// 5) a box of height (width) <= 2 has no empty column (row)
// 6) among the D4 images satisfying 1) to 5), the least one
namespace {

using rule_t = std::optional<PatternState> (*)(const PatternState &s, Grid box);

std::optional<PatternState> to_origin(const PatternState &s, Grid box) {
    if (!box.top() && !box.left())
        return {};
    auto x = -static_cast<int>(box.left());
    auto y = -static_cast<int>(box.top());
    return s.map([=](Grid g) { return g.translate(x, y); });
}

std::optional<PatternState> to_landscape(const PatternState &s, Grid box) {
    if (!s.last || box.height() <= box.width())
        return {};
    return s.map([](Grid g) { return g.transpose(); });
}

std::optional<PatternState> to_top(const PatternState &s, Grid box) {
    auto h = box.height();
    if (!s.last || static_cast<size_t>(s.last->row) <= h / 2)
        return {};
    return s.map([=](Grid g) { return g.flip_rows(h); });
}

std::optional<PatternState> to_left(const PatternState &s, Grid box) {
    auto w = box.width();
    if (!s.last || static_cast<size_t>(s.last->col) <= w / 2)
        return {};
    return s.map([=](Grid g) { return g.flip_cols(w); });
}

std::optional<PatternState> to_upper_triangle(const PatternState &s, Grid box) {
    if (!s.last || box.height() != box.width() || s.last->row <= s.last->col)
        return {};
    return s.map([](Grid g) { return g.transpose(); });
}

std::optional<PatternState> drop_empty_col(const PatternState &s, Grid box) {
    if (!s.last || box.height() > 2)
        return {};
    auto holes = ~box.col_mask() & ((1u << box.width()) - 1u);
    if (!holes)
        return {};
    auto x = static_cast<size_t>(std::countr_zero(holes));
    return s.map([=](Grid g) { return g.drop_col(x); });
}

std::optional<PatternState> drop_empty_row(const PatternState &s, Grid box) {
    if (!s.last || box.width() > 2)
        return {};
    auto holes = ~box.row_mask() & ((1u << box.height()) - 1u);
    if (!holes)
        return {};
    auto y = static_cast<size_t>(std::countr_zero(holes));
    return s.map([=](Grid g) { return g.drop_row(y); });
}

// 2) to 4) for a last dot at p in an h x w box
bool upright(Point p, size_t h, size_t w) {
    auto r = static_cast<size_t>(p.row);
    auto c = static_cast<size_t>(p.col);
    return h <= w && r <= h / 2 && c <= w / 2 && (h != w || r <= c);
}

std::optional<PatternState> to_least_image(const PatternState &s, Grid box) {
    if (!s.last)
        return {};
    auto key = [](const PatternState &t) {
        return std::make_tuple(t.last->row, t.last->col, t.unused.get_value());
    };
    auto best = s;
    for (auto trs = 1u; trs < 8u; trs++) {
        bool transposed = trs & 4u, flip_y = trs & 2u, flip_x = trs & 1u;
        auto h = box.height(), w = box.width();
        auto r = s.last->row, c = s.last->col;
        if (transposed)
            std::swap(r, c), std::swap(h, w);
        if (flip_y)
            r = static_cast<int>(h) - 1 - r;
        if (flip_x)
            c = static_cast<int>(w) - 1 - c;
        // most states have no other upright image; skip the board work for them
        if (!upright(Point{ r, c }, h, w))
            continue;
        auto g = s.unused;
        if (transposed)
            g = g.transpose();
        if (flip_y)
            g = g.flip_rows(h);
        if (flip_x)
            g = g.flip_cols(w);
        auto t = PatternState{ Point{ r, c }, g };
        if (key(t) < key(best))
            best = t;
    }
    if (best == s)
        return {};
    return best;
}

constexpr std::array<rule_t, 8> rules{
    to_origin,
    to_landscape,
    to_top,
    to_left,
    to_upper_triangle,
    drop_empty_col,
    drop_empty_row,
    to_least_image,
};

}

PatternState simplify(const PatternState &s) {
    auto curr = s;
    for (auto changed = true; changed;) {
        changed = false;
        auto box = curr.occupied();
        for (auto rule : rules) {
            if (auto next = rule(curr, box)) {
                curr = *next;
                changed = true;
                break;
            }
        }
    }
    return curr;
}

bool canonical(const PatternState &s) {
    return simplify(s) == s;
}
