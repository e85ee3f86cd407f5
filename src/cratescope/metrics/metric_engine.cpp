/**
 * @file metric_engine.cpp
 */
#include "cratescope/metrics/metric_engine.hpp"

#include <cmath>

namespace cratescope
{

// ============================================================================
// MetricValues
// ============================================================================

MetricValues::MetricValues(MetricScheme scheme, std::vector<size_t> values)
    : m_scheme(scheme)
    , m_values(std::move(values))
    , m_gamma(default_gamma(scheme))
{
    if (!m_values.empty())
    {
        m_max = *std::max_element(m_values.begin(), m_values.end());
    }
}

double MetricValues::default_gamma(MetricScheme scheme) noexcept
{
    switch (scheme)
    {
    case MetricScheme::CumulativeSize:
    case MetricScheme::DependencyCount:
        return 0.25;
    case MetricScheme::ReverseDependencyCount:
        return 0.5;
    }
    return 1.0;
}

void MetricValues::set_gamma(double gamma) noexcept
{
    m_gamma = std::clamp(gamma, 0.0, 1.0);
}

double MetricValues::output(NodeIdx idx) const
{
    if (m_max == 0)
    {
        return 0.0;
    }
    double ratio = static_cast<double>(value(idx)) / static_cast<double>(m_max);
    return std::pow(ratio, m_gamma);
}

// ============================================================================
// MetricEngine
// ============================================================================

std::vector<size_t> MetricEngine::cumulative_sizes() const
{
    std::vector<size_t> values(m_graph.node_capacity(), 0);
    for (NodeIdx idx : m_graph.node_indices())
    {
        values[idx] = m_graph.size_of(idx).value_or(0);
    }

    // Reverse topological order: a node's value is final before it is shared upward
    const std::vector<NodeIdx> order = m_graph.topological_order();
    for (auto it = order.rbegin(); it != order.rend(); ++it)
    {
        const auto& dependents = m_graph.neighbors(*it, Direction::Incoming);
        if (dependents.empty())
        {
            continue;
        }
        size_t share = values[*it] / dependents.size();
        for (NodeIdx source : dependents)
        {
            values[source] += share;
        }
    }

    return values;
}

std::vector<size_t> MetricEngine::dependency_counts() const
{
    std::vector<size_t> values(m_graph.node_capacity(), 0);

    const std::vector<NodeIdx> order = m_graph.topological_order();
    for (auto it = order.rbegin(); it != order.rend(); ++it)
    {
        for (NodeIdx target : m_graph.neighbors(*it, Direction::Outgoing))
        {
            values[*it] += values[target] + 1;
        }
    }

    return values;
}

std::vector<size_t> MetricEngine::reverse_dependency_counts() const
{
    std::vector<size_t> values(m_graph.node_capacity(), 0);

    for (NodeIdx node : m_graph.topological_order())
    {
        for (NodeIdx target : m_graph.neighbors(node, Direction::Outgoing))
        {
            values[target] += 1;
        }
    }

    return values;
}

std::vector<std::set<NodeIdx>> MetricEngine::highlight_classes(HighlightDirection direction) const
{
    std::vector<std::set<NodeIdx>> classes(m_graph.node_capacity());
    const std::vector<NodeIdx> order = m_graph.topological_order();

    if (direction == HighlightDirection::Dependencies)
    {
        // Push each group down to the dependencies
        for (NodeIdx node : order)
        {
            classes[node].insert(node);
            for (NodeIdx target : m_graph.neighbors(node, Direction::Outgoing))
            {
                classes[target].insert(classes[node].begin(), classes[node].end());
            }
        }
    }
    else
    {
        // Pull each group up from the dependencies
        for (auto it = order.rbegin(); it != order.rend(); ++it)
        {
            classes[*it].insert(*it);
            for (NodeIdx target : m_graph.neighbors(*it, Direction::Outgoing))
            {
                classes[*it].insert(classes[target].begin(), classes[target].end());
            }
        }
    }

    return classes;
}

MetricValues MetricEngine::compute(MetricScheme scheme) const
{
    switch (scheme)
    {
    case MetricScheme::CumulativeSize:
        return MetricValues(scheme, cumulative_sizes());
    case MetricScheme::DependencyCount:
        return MetricValues(scheme, dependency_counts());
    case MetricScheme::ReverseDependencyCount:
        return MetricValues(scheme, reverse_dependency_counts());
    }
    throw CrateGraphError(CrateGraphErrorCode::InvalidOption, "Unknown metric scheme");
}

} // namespace cratescope
