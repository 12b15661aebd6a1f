#include "mandelbrot_app.h"
#include "errors.h"
#include "parallel_mandelbrot_calculator.h"
#include "simd_kernel.h"
#include "simd_mandelbrot_calculator.h"
#include "standard_mandelbrot_calculator.h"
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <format>
#include <numeric>

static const char *requireValue(int argc, const char *const argv[], int &i, const char *expected)
{
    if (i + 1 >= argc)
    {
        throw ConfigurationError(std::format("{} requires an argument ({})", argv[i], expected));
    }
    return argv[++i];
}

static int parseInt(const char *option, const char *text)
{
    int value = 0;
    const char *end = text + std::strlen(text);
    auto [ptr, ec] = std::from_chars(text, end, value);
    if (ec != std::errc() || ptr != end)
    {
        throw ConfigurationError(std::format("{} expects an integer, got '{}'", option, text));
    }
    return value;
}

static double parseDouble(const char *option, const char *text)
{
    char *end = nullptr;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0')
    {
        throw ConfigurationError(std::format("{} expects a number, got '{}'", option, text));
    }
    return value;
}

AppOptions parseOptions(int argc, const char *const argv[])
{
    AppOptions options;
    bool centered = false;
    double cre = 0.0, cim = 0.0, diam = 0.0;

    for (int i = 1; i < argc; ++i)
    {
        const char *arg = argv[i];

        if (strcmp(arg, "--engine") == 0)
        {
            options.engine = requireValue(argc, argv, i, "scalar|parallel|simd|all");
            if (options.engine != "scalar" && options.engine != "parallel" && options.engine != "simd" &&
                options.engine != "all")
            {
                throw ConfigurationError(std::format("unknown engine type: {}", options.engine));
            }
        }
        else if (strcmp(arg, "--size") == 0)
        {
            options.resolution.width = parseInt(arg, requireValue(argc, argv, i, "<width> <height>"));
            options.resolution.height = parseInt(arg, requireValue(argc, argv, i, "<width> <height>"));
        }
        else if (strcmp(arg, "--iterations") == 0 || strcmp(arg, "-i") == 0)
        {
            options.iterations = parseInt(arg, requireValue(argc, argv, i, "<n>"));
        }
        else if (strcmp(arg, "--viewport") == 0)
        {
            const char *expected = "<minx> <maxx> <miny> <maxy>";
            options.viewport.minR = parseDouble(arg, requireValue(argc, argv, i, expected));
            options.viewport.maxR = parseDouble(arg, requireValue(argc, argv, i, expected));
            options.viewport.minI = parseDouble(arg, requireValue(argc, argv, i, expected));
            options.viewport.maxI = parseDouble(arg, requireValue(argc, argv, i, expected));
            centered = false;
        }
        else if (strcmp(arg, "--center") == 0)
        {
            const char *expected = "<re> <im> <diam>";
            cre = parseDouble(arg, requireValue(argc, argv, i, expected));
            cim = parseDouble(arg, requireValue(argc, argv, i, expected));
            diam = parseDouble(arg, requireValue(argc, argv, i, expected));
            centered = true;
        }
        else if (strcmp(arg, "--lanes") == 0)
        {
            options.laneWidth = parseInt(arg, requireValue(argc, argv, i, "1|2|4|8|16"));
            if (!isSupportedLaneWidth(options.laneWidth))
            {
                throw ConfigurationError(std::format("unsupported number of vector lanes = {}", options.laneWidth));
            }
        }
        else if (strcmp(arg, "--threads") == 0)
        {
            int threads = parseInt(arg, requireValue(argc, argv, i, "<n>, 0 = all cores"));
            if (threads < 0)
            {
                throw ConfigurationError(std::format("--threads must not be negative, got {}", threads));
            }
            options.threads = static_cast<unsigned>(threads);
        }
        else if (strcmp(arg, "--count-bits") == 0)
        {
            options.countBits = parseInt(arg, requireValue(argc, argv, i, "8|16|32"));
            if (options.countBits != 8 && options.countBits != 16 && options.countBits != 32)
            {
                throw ConfigurationError(std::format("--count-bits must be 8, 16 or 32, got {}", options.countBits));
            }
        }
        else if (strcmp(arg, "--check") == 0 || strcmp(arg, "-c") == 0)
        {
            options.check = true;
        }
        else if (strcmp(arg, "--verbose") == 0 || strcmp(arg, "-v") == 0)
        {
            options.verbose = true;
        }
        else if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0)
        {
            options.help = true;
        }
        else
        {
            throw ConfigurationError(std::format("unknown option: {}", arg));
        }
    }

    // The centered view depends on the final aspect ratio, so it is resolved last
    if (centered)
    {
        options.viewport = Viewport::fromCenter(cre, cim, diam, options.resolution);
    }

    return options;
}

void printUsage(std::ostream &out, const char *program)
{
    out << "Mandelbrot escape-time grid benchmark" << std::endl;
    out << "\nUsage: " << program << " [options]" << std::endl;
    out << "\nOptions:" << std::endl;
    out << "  --engine <type>                  Set computation engine:" << std::endl;
    out << "                                   scalar   = Sequential pixel-by-pixel" << std::endl;
    out << "                                   parallel = Rows across threads" << std::endl;
    out << "                                   simd     = Rows across threads, vectorized lanes" << std::endl;
    out << "                                   all      = All three (default)" << std::endl;
    out << "  --size <W> <H>                   Grid resolution (default 800 600)" << std::endl;
    out << "  --iterations, -i <n>             Iteration budget (default 100)" << std::endl;
    out << "  --viewport <minx> <maxx> <miny> <maxy>" << std::endl;
    out << "                                   Region of the plane (default -2 1 -1.5 1.5)" << std::endl;
    out << "  --center <re> <im> <diam>        Region around a point, square pixels" << std::endl;
    out << "  --lanes <1|2|4|8|16>             Vector lanes (default: native, " << nativeLaneWidth() << " here)"
        << std::endl;
    out << "  --threads <n>                    Worker threads (default 0 = all cores)" << std::endl;
    out << "  --count-bits <8|16|32>           Width of a stored count (default 32)" << std::endl;
    out << "  --check, -c                      Run every engine and verify identical grids" << std::endl;
    out << "  --verbose, -v                    Enable verbose output (timing info)" << std::endl;
    out << "  --help, -h                       Show this help message" << std::endl;
}

MandelbrotApp::MandelbrotApp(const AppOptions &appOptions, std::ostream &output, std::ostream &errors)
    : options(appOptions), out(output), err(errors)
{
    if (options.laneWidth == 0)
    {
        options.laneWidth = nativeLaneWidth();
    }
}

int MandelbrotApp::run()
{
    switch (options.countBits)
    {
    case 8:
        return runWith<std::uint8_t>();
    case 16:
        return runWith<std::uint16_t>();
    case 32:
        return runWith<std::uint32_t>();
    }

    throw ConfigurationError(std::format("--count-bits must be 8, 16 or 32, got {}", options.countBits));
}

template <typename Count>
std::vector<std::unique_ptr<MandelbrotCalculator<Count>>> MandelbrotApp::createCalculators() const
{
    std::vector<std::unique_ptr<MandelbrotCalculator<Count>>> calculators;
    bool all = options.check || options.engine == "all";

    if (all || options.engine == "scalar")
    {
        calculators.push_back(std::make_unique<StandardMandelbrotCalculator<Count>>());
    }
    if (all || options.engine == "parallel")
    {
        calculators.push_back(std::make_unique<ParallelMandelbrotCalculator<Count>>(RowScheduler(options.threads)));
    }
    if (all || options.engine == "simd")
    {
        calculators.push_back(std::make_unique<SimdMandelbrotCalculator<Count>>(options.laneWidth,
                                                                                RowScheduler(options.threads)));
    }

    return calculators;
}

template <typename Count>
IterationGrid<Count> MandelbrotApp::compute(const MandelbrotCalculator<Count> &calculator)
{
    auto startTime = std::chrono::high_resolution_clock::now();

    IterationGrid<Count> grid = calculator.compute(options.viewport, options.resolution, options.iterations);

    auto endTime = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime);
    double milliseconds = duration.count() / 1000.0;

    const auto &data = grid.getData();
    unsigned long long checksum = std::accumulate(data.begin(), data.end(), 0ull);
    long long inside = 0;
    for (Count count : data)
    {
        if (count == static_cast<Count>(options.iterations))
            ++inside;
    }

    if (options.verbose)
    {
        out << std::format("{} {:>4}x{:<4} {:>8.1f} ms  {:>12.8f} {:>12.8f} {:>12.8f} {:>12.8f}  inside={} sum={}\n",
                           calculator.getEngineName(),
                           grid.getWidth(), grid.getHeight(),
                           milliseconds,
                           options.viewport.minR, options.viewport.maxR,
                           options.viewport.minI, options.viewport.maxI,
                           inside, checksum);
    }
    else
    {
        out << std::format("{} {:>4}x{:<4} inside={} sum={}\n",
                           calculator.getEngineName(), grid.getWidth(), grid.getHeight(), inside, checksum);
    }

    return grid;
}

template <typename Count>
int MandelbrotApp::runWith()
{
    auto calculators = createCalculators<Count>();

    if (options.verbose)
    {
        out << std::format("budget {} count {}-bit lanes {} threads {}\n",
                           options.iterations, options.countBits, options.laneWidth,
                           RowScheduler(options.threads).getThreadCount());
    }

    std::vector<IterationGrid<Count>> grids;
    grids.reserve(calculators.size());
    for (const auto &calculator : calculators)
    {
        grids.push_back(compute(*calculator));
    }

    if (options.check)
    {
        for (std::size_t i = 1; i < grids.size(); ++i)
        {
            if (!(grids[i] == grids[0]))
            {
                err << "Mismatch: " << calculators[i]->getEngineName() << " differs from "
                    << calculators[0]->getEngineName() << std::endl;
                return 2;
            }
        }
        out << "All engines agree" << std::endl;
    }

    return 0;
}
