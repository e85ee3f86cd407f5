/**
 * @file metric_engine.hpp
 * @brief Size rollup, dependency counts and highlight groups over a CrateGraph.
 */
#pragma once
#include "cratescope/common/common.hpp"
#include "cratescope/common/crate_graph.hpp"

namespace cratescope
{

/**
 * @brief One metric vector plus the parameters that map it onto `[0, 1]`.
 *
 * @details
 * `values()` is indexed by node index and has `node_capacity()` entries of the graph it
 * was computed from; slots of removed nodes hold 0. `output(i)` is
 * `(values()[i] / max()) ^ gamma()`. A gamma below 1 stretches the low end so that a few
 * dominant crates do not wash out everything else. When `max() == 0` every output is 0.
 */
class MetricValues
{
public:
    MetricValues(MetricScheme scheme, std::vector<size_t> values);

    /**
     * @brief Default gamma of a scheme: 0.25 for sizes and dependency counts, 0.5 for
     *        reverse dependency counts.
     */
    static double default_gamma(MetricScheme scheme) noexcept;

    MetricScheme scheme() const noexcept
    {
        return m_scheme;
    }

    const std::vector<size_t>& values() const noexcept
    {
        return m_values;
    }

    /// Value of a node; 0 for indices outside the vector.
    size_t value(NodeIdx idx) const noexcept
    {
        return idx < m_values.size() ? m_values[idx] : 0;
    }

    size_t max() const noexcept
    {
        return m_max;
    }

    double gamma() const noexcept
    {
        return m_gamma;
    }

    /// Set gamma, clamped to `[0, 1]`.
    void set_gamma(double gamma) noexcept;

    /// Normalized value in `[0, 1]`.
    double output(NodeIdx idx) const;

private:
    MetricScheme m_scheme;
    std::vector<size_t> m_values;
    size_t m_max = 0;
    double m_gamma;
};

/**
 * @brief Computes node metrics from a graph snapshot.
 *
 * @details
 * Every method recomputes from scratch in O(V + E) (O(V^2) for the highlight groups in
 * the worst case); nothing is cached, so results always reflect the graph as it is at
 * the time of the call. All vectors are indexed by node index and sized to the graph's
 * `node_capacity()`.
 *
 * The engine holds a reference to the graph; the graph must outlive it.
 */
class MetricEngine
{
public:
    explicit MetricEngine(const CrateGraph& graph)
        : m_graph(graph)
    {
    }

    /**
     * @brief Own size plus a share of each dependency's cumulative size.
     *
     * @details
     * `cum[v] = size(v) + sum over dependencies c of cum[c] / dependents(c)`, evaluated
     * dependencies first. A dependency shared by k dependents contributes a k-th of its
     * cumulative size to each, so the root's value equals the total size of the graph
     * up to rounding. Each share is floored (integer division); missing sizes count as 0.
     */
    std::vector<size_t> cumulative_sizes() const;

    /**
     * @brief Number of dependency edges reachable from each node, counted per path.
     * @details `deps[v] = sum over dependencies t of (deps[t] + 1)`.
     */
    std::vector<size_t> dependency_counts() const;

    /**
     * @brief Number of direct dependents of each node.
     * @details Each node adds 1 to each of its dependencies in one topological sweep.
     */
    std::vector<size_t> reverse_dependency_counts() const;

    /**
     * @brief Highlight group of every node.
     *
     * @details
     * For `Dependencies`, the group of `v` holds `v` and all its transitive dependents;
     * for `Dependents`, `v` and all its transitive dependencies. Groups of removed node
     * slots are empty. See `HighlightDirection`.
     */
    std::vector<std::set<NodeIdx>> highlight_classes(HighlightDirection direction) const;

    /**
     * @brief Compute a scheme's vector wrapped with its default gamma.
     */
    MetricValues compute(MetricScheme scheme) const;

private:
    const CrateGraph& m_graph;
};

} // namespace cratescope
