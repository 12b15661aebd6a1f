#include "mandelbrot_app.h"
#include <iostream>

int main(int argc, char *argv[])
{
    try
    {
        AppOptions options = parseOptions(argc, argv);

        if (options.help)
        {
            printUsage(std::cout, argv[0]);
            return 0;
        }

        MandelbrotApp app(options);
        return app.run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
