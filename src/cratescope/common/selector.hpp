/**
 * @file selector.hpp
 * @brief Resolve user-supplied crate patterns to node indices.
 */
#pragma once
#include "cratescope/common/common.hpp"
#include "cratescope/common/crate_graph.hpp"

namespace cratescope
{

/**
 * @brief All live nodes whose full name starts with `pattern`, in ascending index order.
 *
 * @details
 * Full names are `short_name + " " + extra`, so `serde` matches `serde v1.0.0` and
 * `serde_json v1.0.140`, while `serde v1` matches only the former.
 */
std::vector<NodeIdx> match_nodes(const CrateGraph& graph, std::string_view pattern);

/**
 * @brief Resolve the root selector.
 * @throw AmbiguousSelectorError unless exactly one node matches.
 */
NodeIdx select_root(const CrateGraph& graph, const std::string& pattern);

/**
 * @brief Resolve every exclude selector.
 * @return The union of the resolved indices, ascending and without duplicates.
 * @throw AmbiguousSelectorError for the first pattern that does not match exactly one
 *        node.
 */
std::vector<NodeIdx> select_excludes(const CrateGraph& graph, const std::vector<std::string>& patterns);

} // namespace cratescope
