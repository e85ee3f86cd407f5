/**
 * @file selector.cpp
 */
#include "cratescope/common/selector.hpp"

#include <spdlog/spdlog.h>

namespace cratescope
{

namespace
{

NodeIdx select_one(const CrateGraph& graph, const std::string& pattern, const char* role)
{
    std::vector<NodeIdx> matches = match_nodes(graph, pattern);
    if (matches.size() == 1)
    {
        spdlog::debug("{} pattern '{}' selects '{}'", role, pattern, graph.node_weight(matches.front()).full());
        return matches.front();
    }

    std::string message = std::string(role) + " pattern '" + pattern + "' ";
    if (matches.empty())
    {
        message += "matches no crate";
    }
    else
    {
        message += "matches " + std::to_string(matches.size()) + " crates:";
        for (NodeIdx idx : matches)
        {
            message += "\n  " + graph.node_weight(idx).full();
        }
    }
    throw AmbiguousSelectorError(pattern, std::move(matches), message);
}

} // namespace

std::vector<NodeIdx> match_nodes(const CrateGraph& graph, std::string_view pattern)
{
    std::vector<NodeIdx> matches;
    for (NodeIdx idx : graph.node_indices())
    {
        const std::string& full = graph.node_weight(idx).full();
        if (full.size() >= pattern.size() && full.compare(0, pattern.size(), pattern) == 0)
        {
            matches.push_back(idx);
        }
    }
    return matches;
}

NodeIdx select_root(const CrateGraph& graph, const std::string& pattern)
{
    return select_one(graph, pattern, "Root");
}

std::vector<NodeIdx> select_excludes(const CrateGraph& graph, const std::vector<std::string>& patterns)
{
    std::set<NodeIdx> selected;
    for (const std::string& pattern : patterns)
    {
        selected.insert(select_one(graph, pattern, "Exclude"));
    }
    return std::vector<NodeIdx>(selected.begin(), selected.end());
}

} // namespace cratescope
