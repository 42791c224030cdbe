#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "argument_parser.hpp"

using prd::ArgumentParser;

namespace {

// Redirects std::cerr for the lifetime of the object
class CaptureStderr {
    std::streambuf* old_buffer;
    std::ostringstream captured_stderr;
public:
    CaptureStderr() {
        old_buffer = std::cerr.rdbuf(captured_stderr.rdbuf());
    }

    ~CaptureStderr() {
        std::cerr.rdbuf(old_buffer);
    }

    std::string get_output() const {
        return captured_stderr.str();
    }
};

// Owns a mutable argv built from a command line of the driver
class CommandLine {
public:
    explicit CommandLine(std::vector<std::string> args) : _args(std::move(args)) {
        _args.insert(_args.begin(), "prd_fire_sizing");
        for (std::string& arg : _args) {
            _argv.push_back(&arg[0]);
        }
        _argv.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(_args.size()); }
    char** argv() { return _argv.data(); }

private:
    std::vector<std::string> _args;
    std::vector<char*> _argv;
};

bool parse(ArgumentParser& parser, std::vector<std::string> args) {
    CommandLine line(std::move(args));
    return parser.parse(line.argc(), line.argv());
}

ArgumentParser driver_parser() {
    return ArgumentParser::prd_fire_sizing_parser("prd_fire_sizing");
}

} // namespace

TEST(FireSizingParserTest, Defaults) {
    ArgumentParser parser = driver_parser();
    ASSERT_TRUE(parse(parser, {"case.h5"}));

    EXPECT_EQ(parser.get_positional(0), "case.h5");
    EXPECT_EQ(parser.get_option("output"), "");
    EXPECT_EQ(parser.get_count("sweep_points"), 0u);
    EXPECT_EQ(parser.get_count("profile_points"), 0u);
    EXPECT_EQ(parser.get_option("device"), "serial");
    EXPECT_FALSE(parser.get_flag("verbose"));
}

TEST(FireSizingParserTest, AllOptions) {
    ArgumentParser parser = driver_parser();
    ASSERT_TRUE(parse(parser, {"--verbose", "case.h5", "--output", "result.h5", "--sweep_points", "50",
                               "--profile_points", "20", "--device", "openmp"}));

    EXPECT_EQ(parser.get_positional(0), "case.h5");
    EXPECT_EQ(parser.get_option("output"), "result.h5");
    EXPECT_EQ(parser.get_count("sweep_points"), 50u);
    EXPECT_EQ(parser.get_count("profile_points"), 20u);
    EXPECT_EQ(parser.get_option("device"), "openmp");
    EXPECT_TRUE(parser.get_flag("verbose"));
}

TEST(FireSizingParserTest, KokkosArgumentsPassThrough) {
    ArgumentParser parser = driver_parser();
    ASSERT_TRUE(parse(parser, {"--kokkos-num-threads=4", "case.h5", "--kokkos-print-configuration"}));
    EXPECT_EQ(parser.get_positional(0), "case.h5");
}

TEST(FireSizingParserTest, MissingCaseFile) {
    ArgumentParser parser = driver_parser();
    CaptureStderr capture;
    EXPECT_FALSE(parse(parser, {"--device", "serial"}));
    EXPECT_NE(capture.get_output().find("Not enough positional arguments"), std::string::npos);
}

TEST(FireSizingParserTest, ExtraPositional) {
    ArgumentParser parser = driver_parser();
    CaptureStderr capture;
    EXPECT_FALSE(parse(parser, {"case.h5", "other.h5"}));
    EXPECT_NE(capture.get_output().find("Too many positional arguments"), std::string::npos);
}

TEST(FireSizingParserTest, OptionWithoutValue) {
    {
        ArgumentParser parser = driver_parser();
        CaptureStderr capture;
        EXPECT_FALSE(parse(parser, {"case.h5", "--sweep_points"}));
        EXPECT_NE(capture.get_output().find("--sweep_points requires a value"), std::string::npos);
    }
    {
        // the next token is another option, not a value
        ArgumentParser parser = driver_parser();
        CaptureStderr capture;
        EXPECT_FALSE(parse(parser, {"case.h5", "--output", "--verbose"}));
        EXPECT_NE(capture.get_output().find("--output requires a value"), std::string::npos);
    }
}

TEST(FireSizingParserTest, RejectsUnknownDevice) {
    ArgumentParser parser = driver_parser();
    CaptureStderr capture;
    EXPECT_FALSE(parse(parser, {"case.h5", "--device", "cuda"}));

    std::string output = capture.get_output();
    EXPECT_NE(output.find("Invalid value 'cuda' for option 'device'"), std::string::npos) << output;
    EXPECT_NE(output.find("'serial' 'openmp'"), std::string::npos) << output;
}

TEST(FireSizingParserTest, RejectsUnknownOption) {
    ArgumentParser parser = driver_parser();
    CaptureStderr capture;
    EXPECT_FALSE(parse(parser, {"case.h5", "--threads", "4"}));
    EXPECT_NE(capture.get_output().find("Unknown option: --threads"), std::string::npos);
}

TEST(FireSizingParserTest, HelpStopsParsing) {
    ArgumentParser parser = driver_parser();
    CaptureStderr capture;
    EXPECT_FALSE(parse(parser, {"case.h5", "--help"}));

    std::string output = capture.get_output();
    EXPECT_EQ(output.find("Usage: prd_fire_sizing <case_file> [options]"), 0u) << output;
    EXPECT_NE(output.find("--sweep_points VALUE"), std::string::npos);
    EXPECT_NE(output.find("(default: serial) [choices: serial openmp]"), std::string::npos);
    EXPECT_NE(output.find("--verbose"), std::string::npos);

    ArgumentParser short_form = driver_parser();
    EXPECT_FALSE(parse(short_form, {"-h"}));
}

TEST(FireSizingParserTest, CountsMustBeNonNegativeIntegers) {
    for (const char* bad : {"abc", "1.5", "3x"}) {
        ArgumentParser parser = driver_parser();
        ASSERT_TRUE(parse(parser, {"case.h5", "--sweep_points", bad}));
        EXPECT_THROW(parser.get_count("sweep_points"), std::invalid_argument) << bad;
    }

    ArgumentParser parser = driver_parser();
    ASSERT_TRUE(parse(parser, {"case.h5", "--profile_points", "007"}));
    EXPECT_EQ(parser.get_count("profile_points"), 7u);
    EXPECT_THROW(parser.get_count("output"), std::invalid_argument); // unset, empty
}

TEST(ArgumentParserTest, DefaultOutsideChoicesWarns) {
    ArgumentParser parser("tool", "Test description");
    CaptureStderr capture;
    parser.add_option("mode", "Mode", "fast", {"slow", "exact"});
    EXPECT_NE(capture.get_output().find("Warning: Default value 'fast'"), std::string::npos);
}

TEST(ArgumentParserTest, UnknownNamesReadAsUnset) {
    ArgumentParser parser("tool", "Test description");
    parser.add_option("level", "Level", "1");
    parser.add_flag("quiet", "Quiet");

    CommandLine line({"--quiet"});
    ASSERT_TRUE(parser.parse(line.argc(), line.argv()));

    EXPECT_TRUE(parser.get_flag("quiet"));
    EXPECT_FALSE(parser.get_flag("level"));   // options are not flags
    EXPECT_EQ(parser.get_option("missing"), "");
    EXPECT_EQ(parser.get_positional(3), "");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
