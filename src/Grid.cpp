#include "Grid.hpp"

template <bool Swap, bool FlipX, bool FlipY>
Grid Grid::transform() const {
    if (!value) return Grid{};
    grid_t out{};
    // iterate from out's MSB to LSB
    for (auto i = 0u; i < LEN * LEN; i++) {
        auto out_row = (LEN * LEN - i - 1) / LEN;
        auto out_col = (LEN * LEN - i - 1) % LEN;
        out <<= 1;
        auto in_row = Swap ? out_col : out_row;
        auto in_col = Swap ? out_row : out_col;
        if constexpr (FlipX) in_col = LEN - in_col - 1;
        if constexpr (FlipY) in_row = LEN - in_row - 1;
        out |= test(in_row, in_col);
    }
    return Grid{ out };
}

Grid Grid::translate(int x, int y) const {
    auto v = value;
    while (y > 0) v <<= LEN, y--;
    while (y < 0) v >>= LEN, y++;
    while (x > 0) v = (v & ~(FIRST_COL << (LEN - 1))) << 1u, x--;
    while (x < 0) v &= ~FIRST_COL, v >>= 1u, x++;
    return Grid{ v };
}

Grid Grid::flip_rows(size_t h) const {
    return transform<false, false, true>().translate(0, -static_cast<int>(LEN - h));
}

Grid Grid::flip_cols(size_t w) const {
    return transform<false, true, false>().translate(-static_cast<int>(LEN - w), 0);
}

Grid Grid::drop_row(size_t y) const {
    grid_t low = value & ((1ull << (y * LEN)) - 1ull);
    grid_t high = y + 1 < LEN ? (value >> ((y + 1) * LEN)) << (y * LEN) : grid_t{};
    return Grid{ low | high };
}

Grid Grid::drop_col(size_t x) const {
    grid_t low = FIRST_COL * ((1ull << x) - 1ull);
    grid_t high = FIRST_COL * (FIRST_ROW & ~((1ull << (x + 1)) - 1ull));
    return Grid{ (value & low) | ((value & high) >> 1u) };
}

template Grid Grid::transform<false, false, false>() const;
template Grid Grid::transform<false, true,  false>() const;
template Grid Grid::transform<false, false, true >() const;
template Grid Grid::transform<false, true,  true >() const;
template Grid Grid::transform<true,  false, false>() const;
template Grid Grid::transform<true,  true,  false>() const;
template Grid Grid::transform<true,  false, true >() const;
template Grid Grid::transform<true,  true,  true >() const;
