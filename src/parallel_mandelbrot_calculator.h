#pragma once

#include "standard_mandelbrot_calculator.h"
#include "row_scheduler.h"

// Scalar kernel with rows distributed over a thread pool
template <typename Count>
class ParallelMandelbrotCalculator : public StandardMandelbrotCalculator<Count>
{
public:
    explicit ParallelMandelbrotCalculator(RowScheduler scheduler = RowScheduler());

    IterationGrid<Count> compute(const Viewport &viewport, const Resolution &resolution, int budget) const override;

    std::string getEngineName() const override { return "   par"; }

    const RowScheduler &getScheduler() const { return scheduler; }

private:
    RowScheduler scheduler;
};

extern template class ParallelMandelbrotCalculator<std::uint8_t>;
extern template class ParallelMandelbrotCalculator<std::uint16_t>;
extern template class ParallelMandelbrotCalculator<std::uint32_t>;
