/**
 * @file options_tests.cpp
 * Unit tests for command-line parsing and option value parsers
 */
#include <gtest/gtest.h>
#include "cratescope/common/graph_exceptions.hpp"
#include "cratescope/config/options.hpp"

#include <filesystem>
#include <fstream>

using namespace cratescope;

namespace
{

template <size_t N>
CommandLine parse(const char* const (&argv)[N])
{
    return parse_options(static_cast<int>(N), argv);
}

template <size_t N>
CrateGraphErrorCode parse_error_code(const char* const (&argv)[N])
{
    try
    {
        parse(argv);
    }
    catch (const CrateGraphError& e)
    {
        return e.code();
    }
    ADD_FAILURE() << "expected parse_options to throw";
    return CrateGraphErrorCode::InvalidState;
}

} // namespace

// ============================================================================
// parse_options
// ============================================================================

TEST(OptionsTests, ParseOptions_Defaults)
{
    const char* const argv[] = {"cratescope", "tree.txt"};
    CommandLine command_line = parse(argv);
    const AnalysisOptions& options = command_line.options;

    EXPECT_FALSE(command_line.help);
    EXPECT_EQ(options.tree_path, "tree.txt");
    EXPECT_EQ(options.size_report_path, "");
    EXPECT_FALSE(options.bin.has_value());
    EXPECT_FALSE(options.with_std);
    EXPECT_FALSE(options.root.has_value());
    EXPECT_TRUE(options.excludes.empty());
    EXPECT_FALSE(options.max_depth.has_value());
    EXPECT_FALSE(options.threshold.has_value());
    EXPECT_EQ(options.scheme, std::optional<MetricScheme>(MetricScheme::CumulativeSize));
    EXPECT_FALSE(options.gamma.has_value());
    EXPECT_FALSE(options.highlight.has_value());
    EXPECT_EQ(options.format, OutputFormat::Text);
    EXPECT_EQ(options.log_level, "warn");
}

TEST(OptionsTests, ParseOptions_EveryOption)
{
    const char* const argv[] = {"cratescope", "tree.txt",     "--sizes",  "bloat.json", "--bin",   "my-app",
                                "--root",     "serde_json",   "--exclude", "rand v0.7", "--exclude", "log",
                                "--depth",    "3",            "--threshold", "21KiB",   "--scheme", "rev-dep-count",
                                "--gamma",    "0.75",         "--highlight", "rev-dep", "--format", "json",
                                "--log-level", "debug",       "--std"};
    const AnalysisOptions options = parse(argv).options;

    EXPECT_EQ(options.size_report_path, "bloat.json");
    EXPECT_EQ(options.bin, std::optional<std::string>("my-app"));
    EXPECT_TRUE(options.with_std);
    EXPECT_EQ(options.root, std::optional<std::string>("serde_json"));
    EXPECT_EQ(options.excludes, (std::vector<std::string>{"rand v0.7", "log"}));
    EXPECT_EQ(options.max_depth, std::optional<size_t>(3));
    EXPECT_EQ(options.threshold, std::optional<size_t>(21 * 1024));
    EXPECT_EQ(options.scheme, std::optional<MetricScheme>(MetricScheme::ReverseDependencyCount));
    EXPECT_EQ(options.gamma, std::optional<double>(0.75));
    EXPECT_EQ(options.highlight, std::optional<HighlightDirection>(HighlightDirection::Dependents));
    EXPECT_EQ(options.format, OutputFormat::Json);
    EXPECT_EQ(options.log_level, "debug");
}

TEST(OptionsTests, ParseOptions_SchemeNone)
{
    const char* const argv[] = {"cratescope", "tree.txt", "--scheme", "none"};
    EXPECT_FALSE(parse(argv).options.scheme.has_value());
}

TEST(OptionsTests, ParseOptions_GammaIsClamped)
{
    const char* const argv[] = {"cratescope", "tree.txt", "--gamma", "4"};
    EXPECT_EQ(parse(argv).options.gamma, std::optional<double>(1.0));
}

TEST(OptionsTests, ParseOptions_Help)
{
    const char* const argv[] = {"cratescope", "--help"};
    CommandLine command_line = parse(argv);
    EXPECT_TRUE(command_line.help);
    EXPECT_NE(command_line.usage.find("--threshold"), std::string::npos);
}

TEST(OptionsTests, ParseOptions_MissingTreeIsInvalid)
{
    const char* const argv[] = {"cratescope", "--scheme", "dep-count"};
    EXPECT_EQ(parse_error_code(argv), CrateGraphErrorCode::InvalidOption);
}

TEST(OptionsTests, ParseOptions_UnknownOptionIsInvalid)
{
    const char* const argv[] = {"cratescope", "tree.txt", "--colour", "red"};
    EXPECT_EQ(parse_error_code(argv), CrateGraphErrorCode::InvalidOption);
}

TEST(OptionsTests, ParseOptions_BadValueIsInvalid)
{
    const char* const scheme[] = {"cratescope", "tree.txt", "--scheme", "size"};
    EXPECT_EQ(parse_error_code(scheme), CrateGraphErrorCode::InvalidOption);

    const char* const depth[] = {"cratescope", "tree.txt", "--depth", "deep"};
    EXPECT_EQ(parse_error_code(depth), CrateGraphErrorCode::InvalidOption);
}

TEST(OptionsTests, ParseOptions_NegativeDepthIsInvalid)
{
    const char* const argv[] = {"cratescope", "tree.txt", "--depth=-1"};
    EXPECT_EQ(parse_error_code(argv), CrateGraphErrorCode::InvalidOption);
}

TEST(OptionsTests, ParseOptions_MissingConfigFileIsInvalid)
{
    const char* const argv[] = {"cratescope", "tree.txt", "--config", "/nonexistent/cratescope.ini"};
    EXPECT_EQ(parse_error_code(argv), CrateGraphErrorCode::InvalidOption);
}

TEST(OptionsTests, ParseOptions_ConfigFileFillsUnsetOptions)
{
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "cratescope_options_tests.ini";
    {
        std::ofstream ofs(path);
        ofs << "# analysis defaults\n"
            << "scheme = rev-dep-count\n"
            << "exclude = serde\n"
            << "depth = 3\n"
            << "std = true\n";
    }

    const std::string path_text = path.string();
    const char* const argv[] = {"cratescope", "tree.txt", "--config", path_text.c_str(), "--scheme", "dep-count"};
    const AnalysisOptions options = parse(argv).options;
    std::filesystem::remove(path);

    EXPECT_EQ(options.scheme, std::optional<MetricScheme>(MetricScheme::DependencyCount));
    EXPECT_EQ(options.excludes, (std::vector<std::string>{"serde"}));
    EXPECT_EQ(options.max_depth, std::optional<size_t>(3));
    EXPECT_TRUE(options.with_std);
}

// ============================================================================
// Value parsers
// ============================================================================

TEST(OptionsTests, ParseScheme_AllNames)
{
    EXPECT_EQ(parse_scheme("cum-sum"), std::optional<MetricScheme>(MetricScheme::CumulativeSize));
    EXPECT_EQ(parse_scheme("dep-count"), std::optional<MetricScheme>(MetricScheme::DependencyCount));
    EXPECT_EQ(parse_scheme("rev-dep-count"), std::optional<MetricScheme>(MetricScheme::ReverseDependencyCount));
    EXPECT_EQ(parse_scheme("none"), std::nullopt);
    EXPECT_THROW(parse_scheme("Cum-Sum"), CrateGraphError);
}

TEST(OptionsTests, ParseHighlight_BothDirections)
{
    EXPECT_EQ(parse_highlight("dep"), HighlightDirection::Dependencies);
    EXPECT_EQ(parse_highlight("rev-dep"), HighlightDirection::Dependents);
    EXPECT_THROW(parse_highlight("up"), CrateGraphError);
}

TEST(OptionsTests, ParseOutputFormat_TextAndJson)
{
    EXPECT_EQ(parse_output_format("text"), OutputFormat::Text);
    EXPECT_EQ(parse_output_format("json"), OutputFormat::Json);
    EXPECT_THROW(parse_output_format("dot"), CrateGraphError);
}

TEST(OptionsTests, ParseDepth_AcceptsNonNegativeIntegers)
{
    EXPECT_EQ(parse_depth("0"), 0u);
    EXPECT_EQ(parse_depth("12"), 12u);
}

TEST(OptionsTests, ParseDepth_RejectsSignsAndGarbage)
{
    for (const char* text : {"", "-1", "+1", "1.5", "3 ", "deep", "99999999999999999999999"})
    {
        EXPECT_THROW(parse_depth(text), CrateGraphError) << text;
    }
}

TEST(OptionsTests, ParseThreshold_NonZeroIsOneByte)
{
    EXPECT_EQ(parse_threshold("non-zero"), 1u);
}

TEST(OptionsTests, ParseThreshold_Units)
{
    EXPECT_EQ(parse_threshold("512"), 512u);
    EXPECT_EQ(parse_threshold("512B"), 512u);
    EXPECT_EQ(parse_threshold("21KiB"), 21u * 1024u);
    EXPECT_EQ(parse_threshold("69 KB"), 69000u);
    EXPECT_EQ(parse_threshold("2mib"), 2u * 1024u * 1024u);
    EXPECT_EQ(parse_threshold("1GB"), 1000u * 1000u * 1000u);
}

TEST(OptionsTests, ParseThreshold_FractionsAreTruncated)
{
    EXPECT_EQ(parse_threshold("1.5KiB"), 1536u);
    EXPECT_EQ(parse_threshold("0.29 kB"), 290u);
    EXPECT_EQ(parse_threshold("2.5"), 2u);
}

TEST(OptionsTests, ParseThreshold_RejectsMalformedValues)
{
    for (const char* text : {"", "abc", "-5", "1.", ".5", "12XB", "5 KiB extra", "99999999999999999999999"})
    {
        EXPECT_THROW(parse_threshold(text), CrateGraphError) << text;
    }
}
