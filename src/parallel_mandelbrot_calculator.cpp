#include "parallel_mandelbrot_calculator.h"
#include <vector>

template <typename Count>
ParallelMandelbrotCalculator<Count>::ParallelMandelbrotCalculator(RowScheduler rowScheduler)
    : scheduler(rowScheduler)
{
}

template <typename Count>
IterationGrid<Count> ParallelMandelbrotCalculator<Count>::compute(const Viewport &viewport, const Resolution &resolution,
                                                                  int budget) const
{
    MandelbrotCalculator<Count>::validate(viewport, resolution, budget);

    const PixelMapper mapper(viewport, resolution);
    const int width = resolution.width;

    return scheduler.run<Count>(resolution, [&mapper, width, budget](int firstRow, int rowCount, std::vector<Count> &out)
                                { StandardMandelbrotCalculator<Count>::computeRows(mapper, width, budget, firstRow, rowCount, out); });
}

template class ParallelMandelbrotCalculator<std::uint8_t>;
template class ParallelMandelbrotCalculator<std::uint16_t>;
template class ParallelMandelbrotCalculator<std::uint32_t>;
