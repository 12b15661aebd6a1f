#include "standard_mandelbrot_calculator.h"
#include "escape_time.h"
#include <utility>

template <typename Count>
void StandardMandelbrotCalculator<Count>::computeRows(const PixelMapper &mapper, int width, int budget,
                                                     int firstRow, int rowCount, std::vector<Count> &out)
{
    for (int y = firstRow; y < firstRow + rowCount; ++y)
    {
        double cy = mapper.imag(y);
        for (int x = 0; x < width; ++x)
        {
            double cx = mapper.real(x);
            out.push_back(static_cast<Count>(iterate(cx, cy, budget)));
        }
    }
}

template <typename Count>
IterationGrid<Count> StandardMandelbrotCalculator<Count>::compute(const Viewport &viewport, const Resolution &resolution,
                                                                  int budget) const
{
    MandelbrotCalculator<Count>::validate(viewport, resolution, budget);

    PixelMapper mapper(viewport, resolution);

    std::vector<typename IterationGrid<Count>::RowBlock> blocks(1);
    blocks[0].firstRow = 0;
    blocks[0].rowCount = resolution.height;
    blocks[0].counts.reserve(resolution.cellCount());

    computeRows(mapper, resolution.width, budget, 0, resolution.height, blocks[0].counts);

    return IterationGrid<Count>::fromRowBlocks(resolution, std::move(blocks));
}

template class StandardMandelbrotCalculator<std::uint8_t>;
template class StandardMandelbrotCalculator<std::uint16_t>;
template class StandardMandelbrotCalculator<std::uint32_t>;
