#include "PatternState.hpp"

#include <string>

#include "sight.hpp"

bool PatternState::legal(Point candidate) const {
    return legal(candidate, [](Point a, Point b) { return between(a, b); });
}

auto fmt::formatter<PatternState>::format(const PatternState &s, format_context &ctx) const
    -> format_context::iterator {
    std::string txt = s.last ? fmt::format("{}", *s.last) : "()";
    txt += " -> {";
    for (auto first = true; auto p : s.unused) {
        if (!first)
            txt += ", ";
        txt += fmt::format("{}", p);
        first = false;
    }
    txt += "}";
    return formatter<string_view>::format(txt, ctx);
}
