#include "viewport.h"
#include "errors.h"
#include <cmath>
#include <format>

void Resolution::validate() const
{
    if (width <= 0 || height <= 0)
    {
        throw ConfigurationError(std::format("resolution must be positive, got {}x{}", width, height));
    }
}

Viewport Viewport::fromCenter(double cre, double cim, double diam, const Resolution &resolution)
{
    resolution.validate();

    if (!std::isfinite(cre) || !std::isfinite(cim) || !std::isfinite(diam) || diam <= 0.0)
    {
        throw ConfigurationError(std::format("invalid view center ({}, {}) diameter {}", cre, cim, diam));
    }

    double halfR = diam * 0.5 * resolution.width / resolution.height;
    double halfI = diam * 0.5;

    Viewport viewport{cre - halfR, cre + halfR, cim - halfI, cim + halfI};
    viewport.validate();
    return viewport;
}

void Viewport::validate() const
{
    if (!std::isfinite(minR) || !std::isfinite(maxR) || !std::isfinite(minI) || !std::isfinite(maxI))
    {
        throw ConfigurationError(std::format("viewport bounds must be finite, got ({}, {}, {}, {})",
                                             minR, maxR, minI, maxI));
    }

    if (!(maxR > minR) || !(maxI > minI))
    {
        throw ConfigurationError(std::format("degenerate viewport: real [{}, {}], imaginary [{}, {}]",
                                             minR, maxR, minI, maxI));
    }
}

PixelMapper::PixelMapper(const Viewport &viewport, const Resolution &resolution)
    : minr(viewport.minR), mini(viewport.minI),
      stepr((viewport.maxR - viewport.minR) / resolution.width),
      stepi((viewport.maxI - viewport.minI) / resolution.height)
{
}

Complex mapPixel(int row, int col, const Viewport &viewport, const Resolution &resolution)
{
    return PixelMapper(viewport, resolution).map(row, col);
}
