/**
 * @file options.cpp
 */
#include "cratescope/config/options.hpp"
#include "cratescope/common/graph_exceptions.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

#include <boost/program_options.hpp>

namespace bpo = boost::program_options;

namespace cratescope
{

namespace
{

[[noreturn]] void invalid_option(const std::string& message)
{
    throw CrateGraphError(CrateGraphErrorCode::InvalidOption, message);
}

std::string to_lower(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool checked_mul(size_t a, size_t b, size_t& out)
{
    if (a != 0 && b > std::numeric_limits<size_t>::max() / a)
    {
        return false;
    }
    out = a * b;
    return true;
}

// Options that may also appear in a config file
bpo::options_description analysis_description()
{
    bpo::options_description desc("Analysis options");
    // clang-format off
    desc.add_options()
        ("tree", bpo::value<std::string>(),
            "dependency tree listing ('-' reads standard input)")
        ("sizes", bpo::value<std::string>(),
            "size report JSON; without it every crate has size 0")
        ("bin", bpo::value<std::string>(),
            "name of the analysed binary when it differs from the root crate")
        ("std", bpo::value<bool>()->default_value(false)->implicit_value(true),
            "add a node for the standard library")
        ("root", bpo::value<std::string>(),
            "re-root the graph at the crate whose full name starts with this")
        ("exclude", bpo::value<std::vector<std::string>>(),
            "remove the crate whose full name starts with this (repeatable)")
        ("depth", bpo::value<std::string>(),
            "remove crates more than this many edges from the root")
        ("threshold", bpo::value<std::string>(),
            "remove crates whose cumulative size is below this, e.g. 21KiB or non-zero")
        ("scheme", bpo::value<std::string>()->default_value("cum-sum"),
            "metric: cum-sum, dep-count, rev-dep-count or none")
        ("gamma", bpo::value<double>(),
            "exponent applied to normalized metric values, clamped to [0, 1]")
        ("highlight", bpo::value<std::string>(),
            "compute highlight groups: dep or rev-dep")
        ("format", bpo::value<std::string>()->default_value("text"),
            "output format: text or json")
        ("log-level", bpo::value<std::string>()->default_value("warn"),
            "trace, debug, info, warn, error, critical or off");
    // clang-format on
    return desc;
}

template <typename T>
std::optional<T> get_optional(const bpo::variables_map& vm, const char* name)
{
    if (vm.count(name) == 0)
    {
        return std::nullopt;
    }
    return vm[name].as<T>();
}

AnalysisOptions options_from(const bpo::variables_map& vm)
{
    AnalysisOptions options;

    std::optional<std::string> tree = get_optional<std::string>(vm, "tree");
    if (!tree)
    {
        invalid_option("No dependency tree listing given");
    }
    options.tree_path = *tree;
    options.size_report_path = get_optional<std::string>(vm, "sizes").value_or("");

    options.bin = get_optional<std::string>(vm, "bin");
    options.with_std = vm["std"].as<bool>();

    options.root = get_optional<std::string>(vm, "root");
    options.excludes = get_optional<std::vector<std::string>>(vm, "exclude").value_or(std::vector<std::string>{});
    if (auto depth = get_optional<std::string>(vm, "depth"))
    {
        options.max_depth = parse_depth(*depth);
    }
    if (auto threshold = get_optional<std::string>(vm, "threshold"))
    {
        options.threshold = parse_threshold(*threshold);
    }

    options.scheme = parse_scheme(vm["scheme"].as<std::string>());
    if (auto gamma = get_optional<double>(vm, "gamma"))
    {
        options.gamma = std::clamp(*gamma, 0.0, 1.0);
    }
    if (auto highlight = get_optional<std::string>(vm, "highlight"))
    {
        options.highlight = parse_highlight(*highlight);
    }

    options.format = parse_output_format(vm["format"].as<std::string>());
    options.log_level = vm["log-level"].as<std::string>();
    return options;
}

} // namespace

CommandLine parse_options(int argc, const char* const argv[])
{
    bpo::options_description generic("General options");
    // clang-format off
    generic.add_options()
        ("help,h", "print this help")
        ("config,c", bpo::value<std::string>(), "read further options from an INI-style file");
    // clang-format on

    bpo::options_description analysis = analysis_description();
    bpo::options_description all;
    all.add(generic).add(analysis);

    bpo::positional_options_description positional;
    positional.add("tree", 1);

    CommandLine result;
    std::ostringstream usage;
    usage << "Usage: cratescope [options] <tree-listing>\n" << all;
    result.usage = usage.str();

    bpo::variables_map vm;
    try
    {
        bpo::store(bpo::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);

        if (vm.count("help"))
        {
            result.help = true;
            return result;
        }

        // Stored after the command line, so command-line values win
        if (vm.count("config"))
        {
            const std::string& path = vm["config"].as<std::string>();
            std::ifstream ifs(path);
            if (!ifs)
            {
                invalid_option("Cannot open config file '" + path + "'");
            }
            bpo::store(bpo::parse_config_file(ifs, analysis), vm);
        }

        bpo::notify(vm);
    }
    catch (const bpo::error& e)
    {
        invalid_option(e.what());
    }

    result.options = options_from(vm);
    return result;
}

std::optional<MetricScheme> parse_scheme(std::string_view text)
{
    if (text == "cum-sum")
    {
        return MetricScheme::CumulativeSize;
    }
    if (text == "dep-count")
    {
        return MetricScheme::DependencyCount;
    }
    if (text == "rev-dep-count")
    {
        return MetricScheme::ReverseDependencyCount;
    }
    if (text == "none")
    {
        return std::nullopt;
    }
    invalid_option("Unknown scheme '" + std::string(text) +
                   "'; expected cum-sum, dep-count, rev-dep-count or none");
}

HighlightDirection parse_highlight(std::string_view text)
{
    if (text == "dep")
    {
        return HighlightDirection::Dependencies;
    }
    if (text == "rev-dep")
    {
        return HighlightDirection::Dependents;
    }
    invalid_option("Unknown highlight direction '" + std::string(text) + "'; expected dep or rev-dep");
}

OutputFormat parse_output_format(std::string_view text)
{
    if (text == "text")
    {
        return OutputFormat::Text;
    }
    if (text == "json")
    {
        return OutputFormat::Json;
    }
    invalid_option("Unknown output format '" + std::string(text) + "'; expected text or json");
}

size_t parse_depth(std::string_view text)
{
    const std::string error = "Invalid depth '" + std::string(text) + "'; expected a non-negative integer";
    if (text.empty())
    {
        invalid_option(error);
    }
    size_t depth = 0;
    for (char c : text)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
        {
            invalid_option(error);
        }
        size_t digit = static_cast<size_t>(c - '0');
        if (!checked_mul(depth, 10, depth) || depth > std::numeric_limits<size_t>::max() - digit)
        {
            invalid_option(error);
        }
        depth += digit;
    }
    return depth;
}

size_t parse_threshold(std::string_view text)
{
    if (text == "non-zero")
    {
        return 1;
    }

    const std::string error = "Invalid threshold '" + std::string(text) +
                              "'; expected non-zero or a size such as 512, 21KiB or 1.5 MB";

    // "<integer>[.<fraction>]"
    size_t pos = 0;
    size_t integer = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
    {
        size_t digit = static_cast<size_t>(text[pos] - '0');
        if (!checked_mul(integer, 10, integer) || integer > std::numeric_limits<size_t>::max() - digit)
        {
            invalid_option(error);
        }
        integer += digit;
        ++pos;
    }
    if (pos == 0)
    {
        invalid_option(error);
    }

    std::string fraction;
    if (pos < text.size() && text[pos] == '.')
    {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
        {
            fraction.push_back(text[pos]);
            ++pos;
        }
        if (fraction.empty())
        {
            invalid_option(error);
        }
    }

    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
    {
        ++pos;
    }

    static const std::map<std::string, size_t> k_units = {
        {"", 1},
        {"b", 1},
        {"kb", 1000},
        {"mb", 1000 * 1000},
        {"gb", 1000 * 1000 * 1000},
        {"kib", 1024},
        {"mib", 1024 * 1024},
        {"gib", 1024 * 1024 * 1024},
    };
    auto unit = k_units.find(to_lower(text.substr(pos)));
    if (unit == k_units.end())
    {
        invalid_option(error);
    }
    const size_t multiplier = unit->second;

    size_t bytes = 0;
    if (!checked_mul(integer, multiplier, bytes))
    {
        invalid_option(error);
    }

    // Digits past the ninth cannot matter for any supported unit
    if (fraction.size() > 9)
    {
        fraction.resize(9);
    }
    size_t numerator = 0;
    size_t denominator = 1;
    for (char c : fraction)
    {
        numerator = numerator * 10 + static_cast<size_t>(c - '0');
        denominator *= 10;
    }
    size_t fractional_bytes = 0;
    if (!checked_mul(numerator, multiplier, fractional_bytes))
    {
        invalid_option(error);
    }
    fractional_bytes /= denominator;
    if (bytes > std::numeric_limits<size_t>::max() - fractional_bytes)
    {
        invalid_option(error);
    }
    return bytes + fractional_bytes;
}

} // namespace cratescope
