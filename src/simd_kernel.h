#pragma once

// Lane widths the vectorized kernel is instantiated for
constexpr int SUPPORTED_LANE_WIDTHS[] = {1, 2, 4, 8, 16};
constexpr int MAX_LANE_WIDTH = 16;

bool isSupportedLaneWidth(int laneWidth);

// Throws ConfigurationError if laneWidth is not supported or does not divide imageWidth
void validateLaneWidth(int laneWidth, int imageWidth);

// Number of doubles in the widest vector unit of this CPU
int nativeLaneWidth();

// Escape-time counts for laneWidth points at once.
// cr, ci and counts must each hold laneWidth values. Every lane runs the same
// instruction stream; lanes that escaped are masked off and keep their count.
void iterateLanes(const double *cr, const double *ci, int laneWidth, int budget, int *counts);
