#pragma once

#include "viewport.h"

// |z|^2 above this value means the orbit escapes
constexpr double ESCAPE_RADIUS_SQ = 4.0;

// Number of z = z^2 + c steps taken from z = 0 before |z|^2 exceeds
// ESCAPE_RADIUS_SQ, capped at budget. A point that never escapes reports budget.
int iterate(double x, double y, int budget);

inline int iterate(const Complex &c, int budget)
{
    return iterate(c.re, c.im, budget);
}
