#pragma once

#include "iteration_grid.h"
#include "mandelbrot_calculator.h"
#include "viewport.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Command line configuration of the benchmark driver
struct AppOptions
{
    std::string engine = "all"; // scalar | parallel | simd | all
    Resolution resolution{800, 600};
    Viewport viewport{-2.0, 1.0, -1.5, 1.5};
    int iterations = 100;
    int laneWidth = 0;    // 0 = native lane width of this CPU
    unsigned threads = 0; // 0 = hardware concurrency
    int countBits = 32;
    bool check = false;
    bool verbose = false;
    bool help = false;
};

// Parses argv into options. Throws ConfigurationError on unknown options or bad values.
AppOptions parseOptions(int argc, const char *const argv[]);

void printUsage(std::ostream &out, const char *program);

// Runs the selected engines over one view and reports a line per engine
class MandelbrotApp
{
public:
    explicit MandelbrotApp(const AppOptions &options, std::ostream &out = std::cout, std::ostream &err = std::cerr);

    // Returns the process exit code: 0 on success, 2 if --check found engines disagreeing
    int run();


private:
    AppOptions options;
    std::ostream &out;
    std::ostream &err;

    template <typename Count>
    int runWith();

    template <typename Count>
    std::vector<std::unique_ptr<MandelbrotCalculator<Count>>> createCalculators() const;

    template <typename Count>
    IterationGrid<Count> compute(const MandelbrotCalculator<Count> &calculator);
};
