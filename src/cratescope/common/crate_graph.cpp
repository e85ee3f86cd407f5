/**
 * @file crate_graph.cpp
 */
#include "cratescope/common/crate_graph.hpp"

#include <queue>

#include <spdlog/spdlog.h>

namespace cratescope
{

// ============================================================================
// Construction
// ============================================================================

CrateGraph::CrateGraph(std::vector<NodeWeight> nodes, std::vector<EdgeSpec> edges, SizeTable sizes)
    : m_sizes(std::move(sizes))
{
    if (nodes.empty())
    {
        throw CrateGraphError(CrateGraphErrorCode::EmptyInput, "A crate graph needs at least one node");
    }
    for (auto& node : nodes)
    {
        add_node(std::move(node));
    }
    for (auto& edge : edges)
    {
        EdgeWeight& weight = add_edge(edge.source, edge.target);
        for (const auto& [feature, enabled] : edge.weight.features)
        {
            weight.features[feature];
            for (const auto& sub : enabled)
            {
                add_feature(weight.features, feature, sub);
            }
        }
    }
}

NodeIdx CrateGraph::add_node(NodeWeight weight)
{
    return m_nodes.insert(NodeSlot{std::move(weight), {}, {}});
}

EdgeWeight& CrateGraph::add_edge(NodeIdx source, NodeIdx target)
{
    if (!m_nodes.contains(source) || !m_nodes.contains(target))
    {
        throw CrateGraphError(
            CrateGraphErrorCode::InvalidNodeIndex,
            "Edge " + std::to_string(source) + " -> " + std::to_string(target) +
                " refers to a node that does not exist");
    }
    if (source == target)
    {
        throw CrateGraphError(
            CrateGraphErrorCode::SelfLoop,
            "Self-loop edge on node " + std::to_string(source) + " is not allowed");
    }

    auto key = std::make_pair(source, target);
    auto it = m_edges.find(key);
    if (it != m_edges.end())
    {
        return it->second;
    }

    if (is_reachable_from(target, source))
    {
        throw CrateGraphError(
            CrateGraphErrorCode::CycleDetected,
            "Edge " + m_nodes.at(source).weight.full() + " -> " + m_nodes.at(target).weight.full() +
                " would create a cycle");
    }

    m_nodes.at(source).outgoing.push_back(target);
    m_nodes.at(target).incoming.push_back(source);
    return m_edges.emplace(key, EdgeWeight{}).first->second;
}

NodeIdx CrateGraph::add_std_node()
{
    if (m_std)
    {
        return *m_std;
    }
    m_std = add_node(NodeWeight("std", 3));
    return *m_std;
}

void CrateGraph::set_size_table(SizeTable sizes)
{
    m_sizes = std::move(sizes);
    m_sizes_normalized = false;
}

void CrateGraph::normalize_sizes()
{
    if (m_sizes_normalized)
    {
        spdlog::debug("Sizes already normalized; skipping");
        return;
    }

    std::unordered_map<std::string, size_t> counts;
    m_nodes.enumerate([&](size_t, const NodeSlot& node) {
        ++counts[std::string(node.weight.short_name())];
    });
    m_sizes.normalize(counts);
    m_sizes_normalized = true;
}

// ============================================================================
// Queries
// ============================================================================

void CrateGraph::require_node(NodeIdx idx) const
{
    if (!m_nodes.contains(idx))
    {
        throw CrateGraphError(
            CrateGraphErrorCode::InvalidNodeIndex,
            "Node index " + std::to_string(idx) + " does not exist");
    }
}

const CrateGraph::NodeSlot& CrateGraph::slot(NodeIdx idx) const
{
    require_node(idx);
    return m_nodes.at(idx);
}

const NodeWeight& CrateGraph::node_weight(NodeIdx idx) const
{
    return slot(idx).weight;
}

NodeWeight& CrateGraph::node_weight(NodeIdx idx)
{
    require_node(idx);
    return m_nodes.at(idx).weight;
}

const std::vector<NodeIdx>& CrateGraph::neighbors(NodeIdx idx, Direction direction) const
{
    const NodeSlot& node = slot(idx);
    return direction == Direction::Outgoing ? node.outgoing : node.incoming;
}

const EdgeWeight* CrateGraph::find_edge(NodeIdx source, NodeIdx target) const noexcept
{
    auto it = m_edges.find(std::make_pair(source, target));
    return it == m_edges.end() ? nullptr : &it->second;
}

const EdgeWeight& CrateGraph::edge_weight(NodeIdx source, NodeIdx target) const
{
    const EdgeWeight* weight = find_edge(source, target);
    if (weight == nullptr)
    {
        throw CrateGraphError(
            CrateGraphErrorCode::InvalidNodeIndex,
            "No edge " + std::to_string(source) + " -> " + std::to_string(target));
    }
    return *weight;
}

std::optional<size_t> CrateGraph::size_of(NodeIdx idx) const
{
    return m_sizes.lookup(slot(idx).weight.short_name());
}

// ============================================================================
// Traversals
// ============================================================================

std::vector<NodeIdx> CrateGraph::topological_order() const
{
    // Kahn's algorithm over live nodes, seeded in ascending index order
    std::vector<size_t> in_degree(m_nodes.capacity(), 0);
    m_nodes.enumerate([&](size_t idx, const NodeSlot& node) {
        in_degree[idx] = node.incoming.size();
    });

    std::queue<NodeIdx> ready;
    m_nodes.enumerate([&](size_t idx, const NodeSlot& node) {
        if (node.incoming.empty())
        {
            ready.push(idx);
        }
    });

    std::vector<NodeIdx> order;
    order.reserve(m_nodes.size());
    while (!ready.empty())
    {
        NodeIdx current = ready.front();
        ready.pop();
        order.push_back(current);

        for (NodeIdx target : m_nodes.at(current).outgoing)
        {
            if (--in_degree[target] == 0)
            {
                ready.push(target);
            }
        }
    }

    if (order.size() != m_nodes.size())
    {
        throw CrateGraphError(
            CrateGraphErrorCode::CycleDetected,
            "Crate graph has a cycle; " + std::to_string(m_nodes.size() - order.size()) +
                " node(s) have no topological position");
    }
    return order;
}

std::vector<NodeIdx> CrateGraph::dfs() const
{
    std::vector<NodeIdx> order;
    if (!m_nodes.contains(m_root))
    {
        return order;
    }

    std::vector<bool> visited(m_nodes.capacity(), false);
    std::vector<NodeIdx> stack;
    stack.push_back(m_root);

    while (!stack.empty())
    {
        NodeIdx current = stack.back();
        stack.pop_back();

        if (visited[current])
        {
            continue;
        }
        visited[current] = true;
        order.push_back(current);

        // Push in reverse so the first dependency is visited first
        const auto& outgoing = m_nodes.at(current).outgoing;
        for (auto it = outgoing.rbegin(); it != outgoing.rend(); ++it)
        {
            if (!visited[*it])
            {
                stack.push_back(*it);
            }
        }
    }

    return order;
}

std::vector<NodeIdx> CrateGraph::bfs() const
{
    std::vector<NodeIdx> order;
    if (!m_nodes.contains(m_root))
    {
        return order;
    }

    std::vector<bool> visited(m_nodes.capacity(), false);
    std::queue<NodeIdx> queue;
    queue.push(m_root);
    visited[m_root] = true;

    while (!queue.empty())
    {
        NodeIdx current = queue.front();
        queue.pop();
        order.push_back(current);

        for (NodeIdx target : m_nodes.at(current).outgoing)
        {
            if (!visited[target])
            {
                visited[target] = true;
                queue.push(target);
            }
        }
    }

    return order;
}

bool CrateGraph::is_reachable_from(NodeIdx from, NodeIdx target) const
{
    if (from == target)
    {
        return true;
    }

    std::vector<bool> visited(m_nodes.capacity(), false);
    std::vector<NodeIdx> stack;
    stack.push_back(from);

    while (!stack.empty())
    {
        NodeIdx current = stack.back();
        stack.pop_back();

        if (visited[current])
        {
            continue;
        }
        visited[current] = true;

        for (NodeIdx successor : m_nodes.at(current).outgoing)
        {
            if (successor == target)
            {
                return true;
            }
            if (!visited[successor])
            {
                stack.push_back(successor);
            }
        }
    }

    return false;
}

// ============================================================================
// Mutation
// ============================================================================

void CrateGraph::change_root(NodeIdx new_root)
{
    require_node(new_root);
    m_root = new_root;
    size_t removed = prune_unreachable();
    spdlog::debug("Root changed to {} ({}); {} node(s) removed",
                  new_root, m_nodes.at(new_root).weight.full(), removed);
}

void CrateGraph::remove_nodes(const std::vector<NodeIdx>& indices)
{
    for (NodeIdx idx : indices)
    {
        require_node(idx);
        if (idx == m_root)
        {
            throw CrateGraphError(
                CrateGraphErrorCode::InvalidState,
                "Cannot remove the root node " + m_nodes.at(idx).weight.full());
        }
    }

    size_t removed = 0;
    for (NodeIdx idx : indices)
    {
        if (m_std && idx == *m_std)
        {
            spdlog::debug("Skipping removal of the std node");
            continue;
        }
        if (m_nodes.contains(idx))
        {
            remove_node(idx);
            ++removed;
        }
    }

    size_t pruned = prune_unreachable();
    spdlog::debug("Removed {} node(s) and {} unreachable node(s)", removed, pruned);
}

void CrateGraph::remove_beyond_depth(size_t max_depth)
{
    if (!m_nodes.contains(m_root))
    {
        return;
    }

    std::vector<bool> visited(m_nodes.capacity(), false);
    std::queue<std::pair<NodeIdx, size_t>> queue;
    queue.emplace(m_root, 0);
    visited[m_root] = true;

    while (!queue.empty())
    {
        auto [current, depth] = queue.front();
        queue.pop();
        if (depth >= max_depth)
        {
            continue;
        }

        for (NodeIdx target : m_nodes.at(current).outgoing)
        {
            if (!visited[target])
            {
                visited[target] = true;
                queue.emplace(target, depth + 1);
            }
        }
    }

    size_t removed = remove_not_visited(visited);
    spdlog::debug("Removed {} node(s) deeper than {}", removed, max_depth);
}

size_t CrateGraph::prune_unreachable()
{
    std::vector<bool> visited(m_nodes.capacity(), false);
    for (NodeIdx idx : dfs())
    {
        visited[idx] = true;
    }
    return remove_not_visited(visited);
}

void CrateGraph::remove_node(NodeIdx idx)
{
    NodeSlot& node = m_nodes.at(idx);

    for (NodeIdx target : node.outgoing)
    {
        auto& incoming = m_nodes.at(target).incoming;
        incoming.erase(std::remove(incoming.begin(), incoming.end(), idx), incoming.end());
        m_edges.erase(std::make_pair(idx, target));
    }
    for (NodeIdx source : node.incoming)
    {
        auto& outgoing = m_nodes.at(source).outgoing;
        outgoing.erase(std::remove(outgoing.begin(), outgoing.end(), idx), outgoing.end());
        m_edges.erase(std::make_pair(source, idx));
    }

    m_nodes.erase(idx);
}

size_t CrateGraph::remove_not_visited(const std::vector<bool>& visited)
{
    size_t removed = 0;
    for (NodeIdx idx : m_nodes.indices())
    {
        if (visited[idx] || (m_std && idx == *m_std))
        {
            continue;
        }
        remove_node(idx);
        ++removed;
    }
    return removed;
}

} // namespace cratescope
