#pragma once

#include "errors.h"
#include "iteration_grid.h"
#include "viewport.h"
#include <format>
#include <limits>
#include <string>

// Abstract base class for escape-time engines.
// Count is the integer type stored per pixel; the iteration budget must fit it.
template <typename Count>
class MandelbrotCalculator
{
public:
    virtual ~MandelbrotCalculator() = default;

    // Validates the inputs, then computes one count per pixel.
    // Throws ConfigurationError or NumericOverflowError before any work starts.
    virtual IterationGrid<Count> compute(const Viewport &viewport, const Resolution &resolution, int budget) const = 0;

    // Engine identification for verbose output
    virtual std::string getEngineName() const = 0;

    static void validate(const Viewport &viewport, const Resolution &resolution, int budget)
    {
        viewport.validate();
        resolution.validate();

        if (budget <= 0)
        {
            throw ConfigurationError(std::format("iteration budget must be positive, got {}", budget));
        }

        if (static_cast<unsigned long long>(budget) > std::numeric_limits<Count>::max())
        {
            throw NumericOverflowError(std::format("iteration budget {} does not fit a {}-bit count (max {})",
                                                   budget, std::numeric_limits<Count>::digits,
                                                   static_cast<unsigned long long>(std::numeric_limits<Count>::max())));
        }
    }
};
