#pragma once

#include <concepts>
#include <cstdint>
#include <string>

#include <fmt/format.h>

template <std::integral T>
inline std::string display(T byte) {
    if (byte < 1000ull)
        return fmt::format("{}", byte);
    if (byte < 1024 * 1024ull)
        return fmt::format("{:.2f} Ki", 1.0 * byte / 1024);
    if (byte < 1024 * 1024ull * 1024ull)
        return fmt::format("{:.2f} Mi", 1.0 * byte / 1024 / 1024);
    if (byte < 1024 * 1024ull * 1024ull * 1024ull)
        return fmt::format("{:.2f} Gi", 1.0 * byte / 1024 / 1024 / 1024);
    return fmt::format("{:.3f} Ti", 1.0 * byte / 1024 / 1024 / 1024 / 1024);
}

constexpr inline auto count_digits(unsigned long long v) {
    if (v <= 9) return 1ull;
    return 1ull + count_digits(v / 10);
}
