#include "mandelbrot.h"
#include "errors.h"
#include "parallel_mandelbrot_calculator.h"
#include "simd_mandelbrot_calculator.h"
#include "standard_mandelbrot_calculator.h"
#include <algorithm>
#include <cstdint>
#include <format>

template <typename Count>
IterationGrid<Count> computeScalar(const Viewport &viewport, const Resolution &resolution, int budget)
{
    return StandardMandelbrotCalculator<Count>().compute(viewport, resolution, budget);
}

template <typename Count>
void computeScalarInto(const Viewport &viewport, const Resolution &resolution, int budget, std::span<Count> out)
{
    MandelbrotCalculator<Count>::validate(viewport, resolution, budget);

    if (out.size() != resolution.cellCount())
    {
        throw ConfigurationError(std::format("output buffer holds {} counts, {}x{} needs {}",
                                             out.size(), resolution.width, resolution.height, resolution.cellCount()));
    }

    IterationGrid<Count> grid = computeScalar<Count>(viewport, resolution, budget);
    std::copy(grid.getData().begin(), grid.getData().end(), out.begin());
}

template <typename Count>
IterationGrid<Count> computeParallel(const Viewport &viewport, const Resolution &resolution, int budget,
                                     unsigned threads)
{
    return ParallelMandelbrotCalculator<Count>(RowScheduler(threads)).compute(viewport, resolution, budget);
}

template <typename Count>
IterationGrid<Count> computeParallelVectorized(const Viewport &viewport, const Resolution &resolution, int budget,
                                               int laneWidth, unsigned threads)
{
    return SimdMandelbrotCalculator<Count>(laneWidth, RowScheduler(threads)).compute(viewport, resolution, budget);
}

template IterationGrid<std::uint8_t> computeScalar<std::uint8_t>(const Viewport &, const Resolution &, int);
template void computeScalarInto<std::uint8_t>(const Viewport &, const Resolution &, int, std::span<std::uint8_t>);
template IterationGrid<std::uint8_t> computeParallel<std::uint8_t>(const Viewport &, const Resolution &, int, unsigned);
template IterationGrid<std::uint8_t> computeParallelVectorized<std::uint8_t>(const Viewport &, const Resolution &, int, int, unsigned);

template IterationGrid<std::uint16_t> computeScalar<std::uint16_t>(const Viewport &, const Resolution &, int);
template void computeScalarInto<std::uint16_t>(const Viewport &, const Resolution &, int, std::span<std::uint16_t>);
template IterationGrid<std::uint16_t> computeParallel<std::uint16_t>(const Viewport &, const Resolution &, int, unsigned);
template IterationGrid<std::uint16_t> computeParallelVectorized<std::uint16_t>(const Viewport &, const Resolution &, int, int, unsigned);

template IterationGrid<std::uint32_t> computeScalar<std::uint32_t>(const Viewport &, const Resolution &, int);
template void computeScalarInto<std::uint32_t>(const Viewport &, const Resolution &, int, std::span<std::uint32_t>);
template IterationGrid<std::uint32_t> computeParallel<std::uint32_t>(const Viewport &, const Resolution &, int, unsigned);
template IterationGrid<std::uint32_t> computeParallelVectorized<std::uint32_t>(const Viewport &, const Resolution &, int, int, unsigned);
