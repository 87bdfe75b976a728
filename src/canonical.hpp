#pragma once

#include "PatternState.hpp"

// the representative of all states equal to s up to translation,
// transposition, flips and removal of redundant rows/columns
// idempotent: simplify(simplify(s)) == simplify(s)
[[nodiscard]] PatternState simplify(const PatternState &s);

// true iff simplify(s) == s
[[nodiscard]] bool canonical(const PatternState &s);
