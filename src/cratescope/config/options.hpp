/**
 * @file options.hpp
 * @brief Analysis tunables and their command-line / config-file parsing.
 */
#pragma once
#include "cratescope/common/common.hpp"
#include "cratescope/common/graph_enums.hpp"

namespace cratescope
{

enum class OutputFormat
{
    Text,
    Json
};

/**
 * @brief Every tunable of one analysis run.
 *
 * @details
 * Unset optionals mean "do not apply": no re-rooting, no depth limit, no threshold, no
 * highlight groups. A scheme of `std::nullopt` (`--scheme none`) skips the metric
 * vector. `gamma` overrides the scheme's default gamma and is clamped to `[0, 1]`.
 */
struct AnalysisOptions
{
    std::string tree_path;
    std::string size_report_path;

    std::optional<std::string> bin;
    bool with_std = false;

    std::optional<std::string> root;
    std::vector<std::string> excludes;
    std::optional<size_t> max_depth;
    std::optional<size_t> threshold;

    std::optional<MetricScheme> scheme = MetricScheme::CumulativeSize;
    std::optional<double> gamma;
    std::optional<HighlightDirection> highlight;

    OutputFormat format = OutputFormat::Text;
    std::string log_level = "warn";
};

/**
 * @brief Result of command-line parsing.
 */
struct CommandLine
{
    AnalysisOptions options;

    /// Set by `--help`; `usage` then holds the option descriptions.
    bool help = false;
    std::string usage;
};

/**
 * @brief Parse the command line, and the config file it names with `--config`.
 *
 * @details
 * The config file is INI-style, using the long option names as keys
 * (`scheme = dep-count`, `exclude = serde`). Values given on the command line take
 * precedence over the file.
 *
 * @throw CrateGraphError with `InvalidOption` for unknown options, bad values, a
 *        missing tree listing path, or an unreadable config file.
 */
CommandLine parse_options(int argc, const char* const argv[]);

/**
 * @brief Parse a scheme name: `cum-sum`, `dep-count`, `rev-dep-count`, or `none`.
 * @return The scheme, or `std::nullopt` for `none`.
 * @throw CrateGraphError with `InvalidOption` for anything else.
 */
std::optional<MetricScheme> parse_scheme(std::string_view text);

/**
 * @brief Parse a highlight direction: `dep` or `rev-dep`.
 * @throw CrateGraphError with `InvalidOption` for anything else.
 */
HighlightDirection parse_highlight(std::string_view text);

/**
 * @brief Parse an output format: `text` or `json`.
 * @throw CrateGraphError with `InvalidOption` for anything else.
 */
OutputFormat parse_output_format(std::string_view text);

/**
 * @brief Parse a depth limit: a non-negative decimal integer.
 * @throw CrateGraphError with `InvalidOption` for anything else, including a sign.
 */
size_t parse_depth(std::string_view text);

/**
 * @brief Parse a size threshold in bytes.
 *
 * @details
 * Accepts `non-zero` (meaning 1 byte) or a number with an optional fractional part,
 * optional whitespace and an optional unit: `B`, `KB`, `MB`, `GB` (powers of 1000) or
 * `KiB`, `MiB`, `GiB` (powers of 1024), case-insensitive. Fractional bytes are
 * truncated: `1.5KiB` is 1536, `21 kb` is 21000.
 *
 * @throw CrateGraphError with `InvalidOption` for anything else.
 */
size_t parse_threshold(std::string_view text);

} // namespace cratescope
