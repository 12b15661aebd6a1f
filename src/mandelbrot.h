#pragma once

#include "iteration_grid.h"
#include "viewport.h"
#include <span>

// Entry points for callers that only need a grid.
// All strategies return bit-identical counts for the same inputs; they differ
// only in speed. Count may be std::uint8_t, std::uint16_t or std::uint32_t.

// Sequential scalar
template <typename Count>
IterationGrid<Count> computeScalar(const Viewport &viewport, const Resolution &resolution, int budget);

// Sequential scalar into a caller buffer of exactly width * height counts.
// Nothing is written if the inputs or the buffer size are rejected.
// The grid is computed in full before the copy, so peak memory is twice the output size.
template <typename Count>
void computeScalarInto(const Viewport &viewport, const Resolution &resolution, int budget, std::span<Count> out);

// Scalar kernel across threads; threads 0 uses the hardware concurrency
template <typename Count>
IterationGrid<Count> computeParallel(const Viewport &viewport, const Resolution &resolution, int budget,
                                     unsigned threads = 0);

// Lane-vectorized kernel across threads; resolution.width must be a multiple of laneWidth
template <typename Count>
IterationGrid<Count> computeParallelVectorized(const Viewport &viewport, const Resolution &resolution, int budget,
                                               int laneWidth, unsigned threads = 0);
