#pragma once

#include "mandelbrot_calculator.h"
#include "row_scheduler.h"
#include <cstdint>

// Lane-vectorized kernel with rows distributed over a thread pool.
// The image width must be a multiple of the lane width.
template <typename Count>
class SimdMandelbrotCalculator : public MandelbrotCalculator<Count>
{
public:
    SimdMandelbrotCalculator(int laneWidth, RowScheduler scheduler = RowScheduler());

    IterationGrid<Count> compute(const Viewport &viewport, const Resolution &resolution, int budget) const override;

    std::string getEngineName() const override;

    int getLaneWidth() const { return laneWidth; }

private:
    int laneWidth;
    RowScheduler scheduler;
};

extern template class SimdMandelbrotCalculator<std::uint8_t>;
extern template class SimdMandelbrotCalculator<std::uint16_t>;
extern template class SimdMandelbrotCalculator<std::uint32_t>;
