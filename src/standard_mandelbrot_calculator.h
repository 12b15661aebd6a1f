#pragma once

#include "mandelbrot_calculator.h"
#include <cstdint>
#include <vector>

// Standard implementation of Mandelbrot calculator (top-to-bottom, one thread)
template <typename Count>
class StandardMandelbrotCalculator : public MandelbrotCalculator<Count>
{
public:
    IterationGrid<Count> compute(const Viewport &viewport, const Resolution &resolution, int budget) const override;

    std::string getEngineName() const override { return "   std"; }

protected:
    // Appends the counts of rows [firstRow, firstRow + rowCount) to out
    static void computeRows(const PixelMapper &mapper, int width, int budget,
                            int firstRow, int rowCount, std::vector<Count> &out);
};

extern template class StandardMandelbrotCalculator<std::uint8_t>;
extern template class StandardMandelbrotCalculator<std::uint16_t>;
extern template class StandardMandelbrotCalculator<std::uint32_t>;
