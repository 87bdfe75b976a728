#pragma once

#include "Grid.hpp"
#include "Point.hpp"

// the points lying strictly between a and b on the segment a-b
// a != b; both must be on the board
[[nodiscard]] Grid between(Point a, Point b);
