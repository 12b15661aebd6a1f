#include "simd_kernel.h"
#include "escape_time.h"
#include "errors.h"
#include <SDL2/SDL_cpuinfo.h>
#include <algorithm>
#include <format>
#include <iterator>

// Checking for all-escaped lanes on every step costs more than the extra
// masked iterations it saves.
static constexpr int EXIT_CHECK_INTERVAL = 8;

template <int LANES>
static void iterateBatch(const double *cx, const double *cy, int budget, int *out)
{
    // Use 64-bit integers for mask and iters to match double width (helps vectorization)
    alignas(64) double cr[LANES];
    alignas(64) double ci[LANES];
    alignas(64) double zr[LANES];
    alignas(64) double zi[LANES];
    alignas(64) long long iters[LANES];
    alignas(64) long long mask[LANES]; // 1 if active, 0 if escaped

    for (int i = 0; i < LANES; ++i)
    {
        cr[i] = cx[i];
        ci[i] = cy[i];
        zr[i] = 0.0;
        zi[i] = 0.0;
        iters[i] = 0;
        mask[i] = 1;
    }

    for (int k = 0; k < budget; ++k)
    {
        // Branchless inner loop for auto-vectorization
        for (int i = 0; i < LANES; ++i)
        {
            double r2 = zr[i] * zr[i];
            double i2 = zi[i] * zi[i];
            double ri = zr[i] * zi[i];

            double next_zr = r2 - i2 + cr[i];
            double next_zi = ri + ri + ci[i];

            bool escaped = (r2 + i2 > ESCAPE_RADIUS_SQ);

            // Once inactive a lane stays inactive
            mask[i] = mask[i] & (!escaped);

            zr[i] = mask[i] ? next_zr : zr[i];
            zi[i] = mask[i] ? next_zi : zi[i];

            iters[i] += mask[i];
        }

        if (k % EXIT_CHECK_INTERVAL == EXIT_CHECK_INTERVAL - 1)
        {
            long long active_lanes = 0;
            for (int i = 0; i < LANES; ++i)
            {
                active_lanes |= mask[i];
            }

            if (active_lanes == 0)
                break;
        }
    }

    for (int i = 0; i < LANES; ++i)
    {
        out[i] = static_cast<int>(iters[i]);
    }
}

bool isSupportedLaneWidth(int laneWidth)
{
    return std::find(std::begin(SUPPORTED_LANE_WIDTHS), std::end(SUPPORTED_LANE_WIDTHS), laneWidth) !=
           std::end(SUPPORTED_LANE_WIDTHS);
}

void validateLaneWidth(int laneWidth, int imageWidth)
{
    if (!isSupportedLaneWidth(laneWidth))
    {
        throw ConfigurationError(std::format("unsupported number of vector lanes = {} (expected 1, 2, 4, 8 or 16)",
                                             laneWidth));
    }

    if (imageWidth % laneWidth != 0)
    {
        throw ConfigurationError(std::format("image width = {} is not divisible by the number of vector lanes = {}",
                                             imageWidth, laneWidth));
    }
}

int nativeLaneWidth()
{
    if (SDL_HasAVX512F())
        return 8;
    if (SDL_HasAVX())
        return 4;
    if (SDL_HasSSE2() || SDL_HasNEON())
        return 2;
    return 1;
}

void iterateLanes(const double *cr, const double *ci, int laneWidth, int budget, int *counts)
{
    switch (laneWidth)
    {
    case 1:
        iterateBatch<1>(cr, ci, budget, counts);
        return;
    case 2:
        iterateBatch<2>(cr, ci, budget, counts);
        return;
    case 4:
        iterateBatch<4>(cr, ci, budget, counts);
        return;
    case 8:
        iterateBatch<8>(cr, ci, budget, counts);
        return;
    case 16:
        iterateBatch<16>(cr, ci, budget, counts);
        return;
    }

    throw ConfigurationError(std::format("unsupported number of vector lanes = {}", laneWidth));
}
