#include "mandelbrot_app.h"
#include "errors.h"
#include "simd_kernel.h"
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

static AppOptions parse(std::vector<const char *> args)
{
    args.insert(args.begin(), "mandelgrid-cli");
    return parseOptions(static_cast<int>(args.size()), args.data());
}

TEST(MandelbrotAppTest, Defaults)
{
    AppOptions options = parse({});

    EXPECT_EQ(options.engine, "all");
    EXPECT_EQ(options.resolution.width, 800);
    EXPECT_EQ(options.resolution.height, 600);
    EXPECT_EQ(options.iterations, 100);
    EXPECT_DOUBLE_EQ(options.viewport.minR, -2.0);
    EXPECT_DOUBLE_EQ(options.viewport.maxI, 1.5);
    EXPECT_EQ(options.laneWidth, 0);
    EXPECT_EQ(options.threads, 0u);
    EXPECT_EQ(options.countBits, 32);
    EXPECT_FALSE(options.check);
    EXPECT_FALSE(options.verbose);
}

TEST(MandelbrotAppTest, ParsesAllOptions)
{
    AppOptions options = parse({"--engine", "simd", "--size", "64", "48", "-i", "250", "--viewport", "-1", "0.5", "-0.25", "0.75",
                                "--lanes", "16", "--threads", "3", "--count-bits", "8", "--check", "-v"});

    EXPECT_EQ(options.engine, "simd");
    EXPECT_EQ(options.resolution.width, 64);
    EXPECT_EQ(options.resolution.height, 48);
    EXPECT_EQ(options.iterations, 250);
    EXPECT_DOUBLE_EQ(options.viewport.minR, -1.0);
    EXPECT_DOUBLE_EQ(options.viewport.maxR, 0.5);
    EXPECT_DOUBLE_EQ(options.viewport.minI, -0.25);
    EXPECT_DOUBLE_EQ(options.viewport.maxI, 0.75);
    EXPECT_EQ(options.laneWidth, 16);
    EXPECT_EQ(options.threads, 3u);
    EXPECT_EQ(options.countBits, 8);
    EXPECT_TRUE(options.check);
    EXPECT_TRUE(options.verbose);
}

TEST(MandelbrotAppTest, CenterUsesTheFinalSize)
{
    AppOptions options = parse({"--center", "-0.5", "0", "3", "--size", "400", "200"});

    EXPECT_DOUBLE_EQ(options.viewport.minI, -1.5);
    EXPECT_DOUBLE_EQ(options.viewport.maxI, 1.5);
    EXPECT_DOUBLE_EQ(options.viewport.minR, -3.5);
    EXPECT_DOUBLE_EQ(options.viewport.maxR, 2.5);
}

TEST(MandelbrotAppTest, RejectsBadArguments)
{
    EXPECT_THROW(parse({"--bogus"}), ConfigurationError);
    EXPECT_THROW(parse({"--engine"}), ConfigurationError);
    EXPECT_THROW(parse({"--engine", "gpu"}), ConfigurationError);
    EXPECT_THROW(parse({"--size", "64"}), ConfigurationError);
    EXPECT_THROW(parse({"--iterations", "ten"}), ConfigurationError);
    EXPECT_THROW(parse({"--iterations", "10x"}), ConfigurationError);
    EXPECT_THROW(parse({"--viewport", "-1", "1", "zero", "1"}), ConfigurationError);
    EXPECT_THROW(parse({"--lanes", "6"}), ConfigurationError);
    EXPECT_THROW(parse({"--threads", "-2"}), ConfigurationError);
    EXPECT_THROW(parse({"--count-bits", "12"}), ConfigurationError);
    EXPECT_THROW(parse({"--center", "0", "0", "-1"}), ConfigurationError);
}

TEST(MandelbrotAppTest, HelpListsEngines)
{
    EXPECT_TRUE(parse({"-h"}).help);

    std::ostringstream out;
    printUsage(out, "mandelgrid-cli");
    EXPECT_NE(out.str().find("--engine"), std::string::npos);
    EXPECT_NE(out.str().find("simd"), std::string::npos);
}

TEST(MandelbrotAppTest, CheckRunsEveryEngine)
{
    AppOptions options = parse({"--size", "32", "24", "-i", "80", "--lanes", "8", "--threads", "2", "--check"});

    std::ostringstream out, err;
    MandelbrotApp app(options, out, err);

    EXPECT_EQ(app.run(), 0);
    EXPECT_NE(out.str().find("   std"), std::string::npos);
    EXPECT_NE(out.str().find("   par"), std::string::npos);
    EXPECT_NE(out.str().find("simd 8"), std::string::npos);
    EXPECT_NE(out.str().find("All engines agree"), std::string::npos);
    EXPECT_TRUE(err.str().empty());
}

TEST(MandelbrotAppTest, SingleEngineVerbose)
{
    AppOptions options = parse({"--engine", "parallel", "--size", "16", "16", "--count-bits", "16", "-v"});

    std::ostringstream out, err;
    MandelbrotApp app(options, out, err);

    EXPECT_EQ(app.run(), 0);
    EXPECT_NE(out.str().find("   par"), std::string::npos);
    EXPECT_NE(out.str().find(" ms "), std::string::npos);
    EXPECT_EQ(out.str().find("   std"), std::string::npos);
}

TEST(MandelbrotAppTest, NativeLanesAreUsedByDefault)
{
    AppOptions options = parse({"--engine", "simd", "--size", "16", "4"});

    std::ostringstream out, err;
    MandelbrotApp app(options, out, err);

    EXPECT_EQ(app.run(), 0);
    EXPECT_NE(out.str().find(std::to_string(nativeLaneWidth()) + " "), std::string::npos);
}

TEST(MandelbrotAppTest, EngineErrorsPropagate)
{
    std::ostringstream out, err;

    AppOptions indivisible = parse({"--engine", "simd", "--size", "30", "4", "--lanes", "8"});
    EXPECT_THROW(MandelbrotApp(indivisible, out, err).run(), ConfigurationError);

    AppOptions overflow = parse({"--engine", "scalar", "--size", "8", "8", "-i", "300", "--count-bits", "8"});
    EXPECT_THROW(MandelbrotApp(overflow, out, err).run(), NumericOverflowError);
}
