#pragma once

// Output size in pixels
struct Resolution
{
    int width;
    int height;

    // Throws ConfigurationError unless both dimensions are positive
    void validate() const;

    unsigned long long cellCount() const
    {
        return static_cast<unsigned long long>(width) * static_cast<unsigned long long>(height);
    }
};

// Rectangular region of the complex plane
struct Viewport
{
    double minR;
    double maxR;
    double minI;
    double maxI;

    // Frames a view around (cre, cim): the imaginary span is diam and the
    // real span follows the aspect ratio of the resolution so pixels stay square.
    static Viewport fromCenter(double cre, double cim, double diam, const Resolution &resolution);

    // Throws ConfigurationError on non-finite bounds or a zero/negative span
    void validate() const;
};

struct Complex
{
    double re;
    double im;
};

// Maps pixel (row, col) to a point of the plane.
// The steps are computed once so every engine sees identical coordinates.
class PixelMapper
{
public:
    PixelMapper(const Viewport &viewport, const Resolution &resolution);

    double real(int col) const { return minr + stepr * col; }
    double imag(int row) const { return mini + stepi * row; }

    Complex map(int row, int col) const { return {real(col), imag(row)}; }

    double getStepR() const { return stepr; }
    double getStepI() const { return stepi; }

private:
    double minr, mini;
    double stepr, stepi;
};

Complex mapPixel(int row, int col, const Viewport &viewport, const Resolution &resolution);
