#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <functional>


#include "Point.hpp"

// a set of points of an 8x8 board
class Grid {
public:
    static constexpr size_t LEN = 8;

    // [LSB] [1] ... [7]
    // [8] ...
    // [16] ...
    // ...
    // [56] ...    [MSB]
    using grid_t = uint64_t;

private:
    static constexpr grid_t FIRST_ROW = static_cast<grid_t>((1ull << LEN) - 1ull);
    static constexpr grid_t FIRST_COL = [] {
        grid_t total{};
        grid_t mask{ 1 };
        for (auto i = 0u; i < LEN; i++)
            total |= mask, mask <<= LEN;
        return total;
    }();

    grid_t value;

    friend std::hash<Grid>;

public:
    constexpr Grid() : value{} { }
    explicit constexpr Grid(grid_t v) : value{ v } { }

    // all cells of a size x size board
    [[nodiscard]] static constexpr Grid square(size_t size) {
        if (!size)
            return Grid{};
        auto row = size >= LEN ? FIRST_ROW : (1ull << size) - 1ull;
        grid_t v{};
        for (auto i = 0u; i < size && i < LEN; i++)
            v |= row << (i * LEN);
        return Grid{ v };
    }

    constexpr operator bool() const { return value; }
    [[nodiscard]] constexpr bool operator==(const Grid &other) const {
        return value == other.value;
    }

    [[nodiscard]] constexpr grid_t get_value() const { return value; }

    [[nodiscard]] constexpr size_t size() const {
        return std::popcount(value);
    }

    // bit i set iff row i is occupied
    [[nodiscard]] constexpr unsigned row_mask() const {
        auto m = 0u;
        for (auto row = 0u; row < LEN; row++)
            if ((value >> (row * LEN)) & FIRST_ROW)
                m |= 1u << row;
        return m;
    }

    // bit i set iff column i is occupied
    [[nodiscard]] constexpr unsigned col_mask() const {
        auto v = value;
        v |= v >> 32u;
        v |= v >> 16u;
        v |= v >> 8u;
        return static_cast<unsigned>(v & FIRST_ROW);
    }

    [[nodiscard]] constexpr size_t top() const {
        return value ? std::countr_zero(row_mask()) : 0u;
    }

    [[nodiscard]] constexpr size_t left() const {
        return value ? std::countr_zero(col_mask()) : 0u;
    }

    // bounding box, excluding top margin
    [[nodiscard]] constexpr size_t height() const {
        return value ? std::bit_width(row_mask()) - top() : 0u;
    }

    // bounding box, excluding left margin
    [[nodiscard]] constexpr size_t width() const {
        return value ? std::bit_width(col_mask()) - left() : 0u;
    }

    [[nodiscard]] constexpr Grid operator|(Grid other) const {
        return Grid{ value | other.value };
    }

    [[nodiscard]] constexpr Grid operator&(Grid other) const {
        return Grid{ value & other.value };
    }

    [[nodiscard]] constexpr Grid operator-(Grid other) const {
        return Grid{ value & ~other.value };
    }

    [[nodiscard]] constexpr bool test(size_t row, size_t col) const {
        return (value >> (row * LEN + col)) & 1u;
    }

    [[nodiscard]] constexpr bool test(Point p) const {
        return test(p.row, p.col);
    }

    [[nodiscard]] constexpr Grid set(size_t row, size_t col) const {
        return Grid{ value | 1ull << (row * LEN + col) };
    }

    [[nodiscard]] constexpr Grid set(Point p) const {
        return set(p.row, p.col);
    }

    [[nodiscard]] constexpr Grid clear(size_t row, size_t col) const {
        return Grid{ value & ~(1ull << (row * LEN + col)) };
    }

    [[nodiscard]] constexpr Grid clear(Point p) const {
        return clear(p.row, p.col);
    }

    // identity, flip X, flip Y, rot180, transpose, rot90 CW, rot90 CCW, anti-transpose
    template <bool Swap, bool FlipX, bool FlipY>
    [[nodiscard]] Grid transform() const;

    //   -y
    // -x  +x
    //   +y
    [[nodiscard]] Grid translate(int x, int y) const;

    // (row, col) -> (col, row)
    [[nodiscard]] Grid transpose() const {
        return transform<true, false, false>();
    }

    // row -> h - 1 - row; all cells must lie in the first h rows
    [[nodiscard]] Grid flip_rows(size_t h) const;

    // col -> w - 1 - col; all cells must lie in the first w columns
    [[nodiscard]] Grid flip_cols(size_t w) const;

    // remove row y, rows below it move up by one
    [[nodiscard]] Grid drop_row(size_t y) const;

    // remove column x, columns right of it move left by one
    [[nodiscard]] Grid drop_col(size_t x) const;

    [[nodiscard]] constexpr Point front() const {
        auto id = static_cast<int>(std::countr_zero(value));
        return Point{ id / static_cast<int>(LEN), id % static_cast<int>(LEN) };
    }

    struct bits_proxy {
        grid_t v;
        bool operator==(const bits_proxy &other) const = default;
        constexpr Point operator*() const {
            auto id = static_cast<int>(std::countr_zero(v));
            return Point{ id / static_cast<int>(LEN), id % static_cast<int>(LEN) };
        }
        constexpr bits_proxy &operator++() {
            v &= v - 1u;
            return *this;
        }
    };
    constexpr bits_proxy begin() const {
        return { value };
    }
    constexpr bits_proxy end() const {
        return { 0 };
    }
};

template <>
struct std::hash<Grid> {
    constexpr size_t operator()(Grid g) const noexcept {
        return g.value;
    }
};

extern template Grid Grid::transform<false, false, false>() const;
extern template Grid Grid::transform<false, true,  false>() const;
extern template Grid Grid::transform<false, false, true >() const;
extern template Grid Grid::transform<false, true,  true >() const;
extern template Grid Grid::transform<true,  false, false>() const;
extern template Grid Grid::transform<true,  true,  false>() const;
extern template Grid Grid::transform<true,  false, true >() const;
extern template Grid Grid::transform<true,  true,  true >() const;
