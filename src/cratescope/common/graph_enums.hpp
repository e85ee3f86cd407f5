/**
 * @file graph_enums.hpp
 */
#pragma once
#include "cratescope/common/common.hpp"

namespace cratescope
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for node (crate) indices.
 *
 * @details
 * `NodeIdx` is a type alias for `size_t` used to identify crates in a `CrateGraph`.
 * Indices are assigned sequentially at insertion and stay stable for the lifetime of
 * the node, but the index range becomes sparse once nodes are removed. Iterate with
 * `CrateGraph::node_indices()` rather than assuming `[0, node_count())`.
 */
using NodeIdx = size_t;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Direction of an adjacency query.
 *
 * @details
 * Edges point from a dependent crate to its dependency. `Outgoing` neighbors of a
 * node are therefore its dependencies; `Incoming` neighbors are its dependents.
 */
enum class Direction
{
    Outgoing,
    Incoming
};

/**
 * @brief Metric used for node coloring.
 */
enum class MetricScheme
{
    CumulativeSize,
    DependencyCount,
    ReverseDependencyCount
};

/**
 * @brief Direction of the interactive highlight groups.
 *
 * @par Semantics
 * - `Dependencies`: the group of a node `v` is `v` plus every transitive dependent of `v`.
 *   Hovering node `u` highlights every node whose group contains `u`, i.e. all of `u`'s
 *   dependencies.
 * - `Dependents`: the group of a node `v` is `v` plus every transitive dependency of `v`.
 *   Hovering node `u` highlights all of `u`'s dependents.
 */
enum class HighlightDirection
{
    Dependencies,
    Dependents
};

/**
 * @brief Human-readable description of a metric scheme, e.g. "cumulative sum".
 */
inline const char* describe(MetricScheme scheme) noexcept
{
    switch (scheme)
    {
    case MetricScheme::CumulativeSize:
        return "cumulative sum";
    case MetricScheme::DependencyCount:
        return "dependency count";
    case MetricScheme::ReverseDependencyCount:
        return "reverse dependency count";
    }
    return "unknown";
}

} // namespace cratescope
