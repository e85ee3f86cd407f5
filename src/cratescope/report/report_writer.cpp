/**
 * @file report_writer.cpp
 */
#include "cratescope/report/report_writer.hpp"

#include <iterator>

#include <fmt/format.h>

namespace cratescope
{

namespace
{

std::string format_size(size_t bytes, double base, const char* const* units, size_t unit_count)
{
    if (static_cast<double>(bytes) < base)
    {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= base && unit + 1 < unit_count)
    {
        value /= base;
        ++unit;
    }
    return fmt::format("{:.2f} {}", value, units[unit]);
}

std::string features_on_one_line(const FeatureMap& features)
{
    std::string text = format_features(features);
    std::string::size_type pos = 0;
    while ((pos = text.find(",\n", pos)) != std::string::npos)
    {
        text.replace(pos, 2, ", ");
        pos += 2;
    }
    return text;
}

} // namespace

std::string format_size_binary(size_t bytes)
{
    static const char* const k_units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    return format_size(bytes, 1024.0, k_units, std::size(k_units));
}

std::string format_size_decimal(size_t bytes)
{
    static const char* const k_units[] = {"B", "kB", "MB", "GB", "TB", "PB"};
    return format_size(bytes, 1000.0, k_units, std::size(k_units));
}

// ============================================================================
// JSON
// ============================================================================

nlohmann::json build_json_report(const CrateGraph& graph, const AnalysisResult& result)
{
    nlohmann::json report;
    report["root"] = graph.root();
    report["std"] = graph.std_node() ? nlohmann::json(*graph.std_node()) : nlohmann::json(nullptr);

    if (result.metric)
    {
        report["metric"] = {
            {"scheme", describe(result.metric->scheme())},
            {"gamma", result.metric->gamma()},
            {"max", result.metric->max()},
        };
    }
    else
    {
        report["metric"] = nullptr;
    }

    nlohmann::json nodes = nlohmann::json::array();
    nlohmann::json edges = nlohmann::json::array();
    for (NodeIdx idx : graph.node_indices())
    {
        const NodeWeight& weight = graph.node_weight(idx);

        nlohmann::json node;
        node["index"] = idx;
        node["name"] = weight.full();
        node["short"] = std::string(weight.short_name());
        node["extra"] = std::string(weight.extra());
        std::optional<size_t> size = graph.size_of(idx);
        node["size"] = size ? nlohmann::json(*size) : nlohmann::json(nullptr);
        node["features"] = weight.features();
        if (result.metric)
        {
            node["value"] = result.metric->value(idx);
            node["output"] = result.metric->output(idx);
        }
        if (result.highlight && idx < result.highlight_classes.size())
        {
            node["highlight"] = result.highlight_classes[idx];
        }
        nodes.push_back(std::move(node));

        for (NodeIdx target : graph.neighbors(idx, Direction::Outgoing))
        {
            edges.push_back(nlohmann::json{
                {"source", idx},
                {"target", target},
                {"features", graph.edge_weight(idx, target).features},
            });
        }
    }
    report["nodes"] = std::move(nodes);
    report["edges"] = std::move(edges);
    return report;
}

// ============================================================================
// Text
// ============================================================================

void write_text_report(std::ostream& os, const CrateGraph& graph, const AnalysisResult& result)
{
    os << fmt::format("root: {} ({} crates, {} edges)\n",
                      graph.node_weight(graph.root()).full(), graph.node_count(), graph.edge_count());
    if (result.metric)
    {
        os << fmt::format("metric: {}, gamma {:.2f}, max {}\n",
                          describe(result.metric->scheme()), result.metric->gamma(), result.metric->max());
    }
    os << "\n";

    os << fmt::format("{:<6} {:<40} {:>12} {:>12} {:>7} {:>6}  {}\n",
                      "index", "crate", "size", "value", "output", "group", "features");

    std::vector<NodeIdx> order = graph.dfs();
    if (graph.std_node())
    {
        order.push_back(*graph.std_node());
    }

    for (NodeIdx idx : order)
    {
        const NodeWeight& weight = graph.node_weight(idx);
        std::optional<size_t> size = graph.size_of(idx);

        std::string value = "-";
        std::string output = "-";
        if (result.metric)
        {
            value = std::to_string(result.metric->value(idx));
            output = fmt::format("{:.3f}", result.metric->output(idx));
        }
        std::string group = "-";
        if (result.highlight && idx < result.highlight_classes.size())
        {
            group = std::to_string(result.highlight_classes[idx].size());
        }

        os << fmt::format("{:<6} {:<40} {:>12} {:>12} {:>7} {:>6}  {}\n",
                          idx, weight.full(), size ? format_size_binary(*size) : "-", value, output, group,
                          features_on_one_line(weight.features()));
    }
}

void write_report(std::ostream& os, const CrateGraph& graph, const AnalysisResult& result, OutputFormat format)
{
    switch (format)
    {
    case OutputFormat::Text:
        write_text_report(os, graph, result);
        break;
    case OutputFormat::Json:
        os << build_json_report(graph, result).dump(2) << "\n";
        break;
    }
}

} // namespace cratescope
