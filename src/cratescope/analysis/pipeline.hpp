/**
 * @file pipeline.hpp
 * @brief Load a crate graph and run one analysis over it.
 */
#pragma once
#include "cratescope/common/common.hpp"
#include "cratescope/common/crate_graph.hpp"
#include "cratescope/config/options.hpp"
#include "cratescope/metrics/metric_engine.hpp"

namespace cratescope
{

/**
 * @brief Metric values and highlight groups of an analysed graph.
 *
 * @details
 * Both are computed from the graph after every mutation of the run; they are invalid
 * once the graph is mutated again.
 */
struct AnalysisResult
{
    /// Set unless the scheme was `none`.
    std::optional<MetricValues> metric;

    /// Set when a highlight direction was requested.
    std::optional<HighlightDirection> highlight;

    /// Highlight group per node index; empty unless `highlight` is set.
    std::vector<std::set<NodeIdx>> highlight_classes;

    /// Nodes removed by the run's mutations.
    size_t removed_nodes = 0;
};

/**
 * @brief Parse a tree listing and a size report into a graph ready for analysis.
 *
 * @details
 * In order: parse the listing; parse the size report (an empty text gives an empty
 * table); if `bin` names a binary other than the root crate, merge the binary's size
 * entry into the root's; add the std node if `with_std`; normalize sizes.
 *
 * @throw TreeParseError, or CrateGraphError with `EmptyInput` or `MalformedSizeReport`.
 */
CrateGraph load_crate_graph(std::string_view tree_text,
                            std::string_view size_report_text,
                            bool with_std,
                            const std::optional<std::string>& bin = std::nullopt);

/**
 * @brief Remove every node whose cumulative size is below `threshold`, then prune.
 *
 * @details
 * Cumulative sizes are computed once, before any removal. The root and the std node are
 * never removed by this filter.
 *
 * @return The number of nodes removed, including those pruned as unreachable.
 */
size_t remove_below_threshold(CrateGraph& graph, size_t threshold);

/**
 * @brief Apply the options' mutations to `graph`, then compute metrics on the result.
 *
 * @details
 * Mutations run in this order: re-root at `options.root`; remove `options.excludes`;
 * remove nodes beyond `options.max_depth`; remove nodes below `options.threshold`.
 * The metric vector and highlight groups are then computed fresh.
 *
 * @throw AmbiguousSelectorError if a root or exclude pattern does not match exactly one
 *        crate; CrateGraphError with `InvalidState` if an exclude pattern selects the
 *        current root.
 */
AnalysisResult run_analysis(CrateGraph& graph, const AnalysisOptions& options);

} // namespace cratescope
