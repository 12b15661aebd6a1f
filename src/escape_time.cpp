#include "escape_time.h"

int iterate(double x, double y, int budget)
{
    double r = 0.0, i = 0.0;
    int iter;

    for (iter = 0; iter < budget; ++iter)
    {
        double r2 = r * r;
        double i2 = i * i;

        if (r2 + i2 > ESCAPE_RADIUS_SQ)
            break;

        double ri = r * i;
        i = ri + ri + y; // z = z^2 + c
        r = r2 - i2 + x;
    }

    return iter;
}
