#include "simd_mandelbrot_calculator.h"
#include "simd_kernel.h"
#include <array>
#include <format>
#include <vector>

template <typename Count>
SimdMandelbrotCalculator<Count>::SimdMandelbrotCalculator(int lanes, RowScheduler rowScheduler)
    : laneWidth(lanes), scheduler(rowScheduler)
{
}

template <typename Count>
IterationGrid<Count> SimdMandelbrotCalculator<Count>::compute(const Viewport &viewport, const Resolution &resolution,
                                                               int budget) const
{
    MandelbrotCalculator<Count>::validate(viewport, resolution, budget);
    validateLaneWidth(laneWidth, resolution.width);

    const PixelMapper mapper(viewport, resolution);
    const int width = resolution.width;
    const int lanes = laneWidth;

    // The initial real values are the same for every row
    std::vector<double> xs(width);
    for (int x = 0; x < width; ++x)
    {
        xs[x] = mapper.real(x);
    }

    return scheduler.run<Count>(resolution, [&](int firstRow, int rowCount, std::vector<Count> &out)
                                {
        alignas(64) std::array<double, MAX_LANE_WIDTH> ci;
        alignas(64) std::array<int, MAX_LANE_WIDTH> iters;

        for (int y = firstRow; y < firstRow + rowCount; ++y)
        {
            ci.fill(mapper.imag(y));

            for (int x = 0; x < width; x += lanes)
            {
                iterateLanes(xs.data() + x, ci.data(), lanes, budget, iters.data());

                for (int i = 0; i < lanes; ++i)
                {
                    out.push_back(static_cast<Count>(iters[i]));
                }
            }
        } });
}

template <typename Count>
std::string SimdMandelbrotCalculator<Count>::getEngineName() const
{
    return std::format("simd{:>2}", laneWidth);
}

template class SimdMandelbrotCalculator<std::uint8_t>;
template class SimdMandelbrotCalculator<std::uint16_t>;
template class SimdMandelbrotCalculator<std::uint32_t>;
