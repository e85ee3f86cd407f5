/**
 * @file pipeline.cpp
 */
#include "cratescope/analysis/pipeline.hpp"
#include "cratescope/common/selector.hpp"
#include "cratescope/parser/tree_parser.hpp"

#include <spdlog/spdlog.h>

namespace cratescope
{

CrateGraph load_crate_graph(std::string_view tree_text,
                            std::string_view size_report_text,
                            bool with_std,
                            const std::optional<std::string>& bin)
{
    CrateGraph graph = TreeParser().parse(tree_text);

    SizeTable sizes = size_report_text.empty() ? SizeTable() : SizeTable::parse(size_report_text);
    if (bin)
    {
        // The size report names compiled artifacts, which use underscores
        std::string bin_name = *bin;
        std::replace(bin_name.begin(), bin_name.end(), '-', '_');
        std::string root_name(graph.node_weight(graph.root()).short_name());
        sizes.merge_into(bin_name, root_name);
    }
    graph.set_size_table(std::move(sizes));

    if (with_std)
    {
        graph.add_std_node();
    }
    graph.normalize_sizes();

    return graph;
}

size_t remove_below_threshold(CrateGraph& graph, size_t threshold)
{
    const std::vector<size_t> sums = MetricEngine(graph).cumulative_sizes();

    std::vector<NodeIdx> small;
    for (NodeIdx idx : graph.node_indices())
    {
        if (idx == graph.root() || idx == graph.std_node())
        {
            continue;
        }
        if (sums[idx] < threshold)
        {
            small.push_back(idx);
        }
    }

    const size_t before = graph.node_count();
    graph.remove_nodes(small);
    const size_t removed = before - graph.node_count();
    spdlog::debug("Threshold {} bytes removed {} nodes", threshold, removed);
    return removed;
}

AnalysisResult run_analysis(CrateGraph& graph, const AnalysisOptions& options)
{
    AnalysisResult result;
    const size_t initial = graph.node_count();

    if (options.root)
    {
        graph.change_root(select_root(graph, *options.root));
    }
    if (!options.excludes.empty())
    {
        graph.remove_nodes(select_excludes(graph, options.excludes));
    }
    if (options.max_depth)
    {
        graph.remove_beyond_depth(*options.max_depth);
    }
    if (options.threshold)
    {
        remove_below_threshold(graph, *options.threshold);
    }
    result.removed_nodes = initial - graph.node_count();

    MetricEngine engine(graph);
    if (options.scheme)
    {
        result.metric = engine.compute(*options.scheme);
        if (options.gamma)
        {
            result.metric->set_gamma(*options.gamma);
        }
    }
    if (options.highlight)
    {
        result.highlight = options.highlight;
        result.highlight_classes = engine.highlight_classes(*options.highlight);
    }

    spdlog::info("Analysed '{}': {} crates, {} edges, {} removed",
                 graph.node_weight(graph.root()).full(), graph.node_count(), graph.edge_count(),
                 result.removed_nodes);
    return result;
}

} // namespace cratescope
