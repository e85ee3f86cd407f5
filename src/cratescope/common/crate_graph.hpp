/**
 * @file crate_graph.hpp
 */
#pragma once
#include "cratescope/common/common.hpp"
#include "cratescope/common/graph_enums.hpp"
#include "cratescope/common/graph_exceptions.hpp"
#include "cratescope/common/graph_items.hpp"
#include "cratescope/common/size_table.hpp"
#include "cratescope/common/slot_list.hpp"

namespace cratescope
{

/**
 * @brief A directed edge to be inserted by the `CrateGraph` bulk constructor.
 */
struct EdgeSpec
{
    NodeIdx source;
    NodeIdx target;
    EdgeWeight weight;
};

/**
 * @brief A crate dependency DAG annotated with sizes and feature metadata.
 *
 * @details
 * Each node is a crate; each edge `source -> target` records that `source` depends on
 * `target`. Sizes are looked up by short name in a `SizeTable` owned by the graph.
 *
 * @par Storage
 * Nodes live in a `SlotList`, so a node index stays valid until that node is removed and
 * is never reused. After removals the index range is sparse: iterate with
 * `node_indices()`, and size index-addressed side tables with `node_capacity()`.
 *
 * @par Invariants
 * - The graph is acyclic. `add_edge()` rejects self-loops and edges that would close a
 *   cycle.
 * - At most one edge exists per ordered pair; adding it again returns the existing
 *   weight so feature maps can be merged.
 * - Once non-empty, `root()` refers to a live node (the first inserted node unless
 *   changed by `change_root()`).
 * - After `change_root()`, `remove_nodes()` and `remove_beyond_depth()`, every live node
 *   except the std node is reachable from the root.
 *
 * @par Lifecycle
 * Built once (by `TreeParser` or the bulk constructor), optionally given a std node and
 * normalized sizes, then only shrunk by the mutation methods. Metrics are computed from
 * a snapshot and must be recomputed after any mutation.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads (const methods) are safe if no concurrent writes occur.
 */
class CrateGraph
{
public:
    CrateGraph() = default;

    /**
     * @brief Build a graph from node and edge lists.
     * @param nodes Node weights; node `i` of the list receives index `i`. The first node
     *        becomes the root.
     * @param edges Edges between indices of `nodes`. Repeated pairs merge their features.
     * @param sizes Size table for `size_of()`; not normalized by this constructor.
     * @throw CrateGraphError with `EmptyInput` if `nodes` is empty, or any error of
     *        `add_edge()`.
     */
    CrateGraph(std::vector<NodeWeight> nodes, std::vector<EdgeSpec> edges, SizeTable sizes = {});

    // -------------------------------------------------------------------------
    // Construction
    // -------------------------------------------------------------------------

    /**
     * @brief Insert a node.
     * @return The index of the new node. The first node inserted becomes the root.
     */
    NodeIdx add_node(NodeWeight weight);

    /**
     * @brief Get or create the edge `source -> target`.
     * @return The edge weight, for merging features into it.
     * @throw CrateGraphError with `InvalidNodeIndex` if either node is not live,
     *        `SelfLoop` if `source == target`, or `CycleDetected` if `target` already
     *        reaches `source`.
     */
    EdgeWeight& add_edge(NodeIdx source, NodeIdx target);

    /**
     * @brief Insert the synthetic `std` node.
     *
     * @details
     * The std node has no edges and is exempt from removal and from reachability
     * pruning. Calling this again returns the existing std node.
     */
    NodeIdx add_std_node();

    /**
     * @brief Replace the size table. Clears the normalized state.
     */
    void set_size_table(SizeTable sizes);

    /**
     * @brief Divide every size entry by the number of live nodes sharing its short name.
     *
     * @details
     * Runs once; later calls do nothing. Call it after the node set is complete (after
     * `add_std_node()`), and before any removal, so that counts cover every version.
     */
    void normalize_sizes();

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    NodeIdx root() const noexcept
    {
        return m_root;
    }

    std::optional<NodeIdx> std_node() const noexcept
    {
        return m_std;
    }

    /// Number of live nodes.
    size_t node_count() const noexcept
    {
        return m_nodes.size();
    }

    /// One past the largest node index ever assigned.
    size_t node_capacity() const noexcept
    {
        return m_nodes.capacity();
    }

    size_t edge_count() const noexcept
    {
        return m_edges.size();
    }

    bool contains_node(NodeIdx idx) const noexcept
    {
        return m_nodes.contains(idx);
    }

    /// Live node indices in ascending order.
    std::vector<NodeIdx> node_indices() const
    {
        return m_nodes.indices();
    }

    /**
     * @throw CrateGraphError with `InvalidNodeIndex` if the node is not live.
     */
    const NodeWeight& node_weight(NodeIdx idx) const;

    /**
     * @throw CrateGraphError with `InvalidNodeIndex` if the node is not live.
     */
    NodeWeight& node_weight(NodeIdx idx);

    /**
     * @brief Direct neighbors of a node, in edge insertion order.
     * @param direction `Outgoing` for dependencies, `Incoming` for dependents.
     * @throw CrateGraphError with `InvalidNodeIndex` if the node is not live.
     */
    const std::vector<NodeIdx>& neighbors(NodeIdx idx, Direction direction) const;

    /**
     * @brief Look up the edge `source -> target`.
     * @return Pointer to the weight, or nullptr if there is no such edge.
     */
    const EdgeWeight* find_edge(NodeIdx source, NodeIdx target) const noexcept;

    /**
     * @throw CrateGraphError with `InvalidNodeIndex` if there is no edge `source -> target`.
     */
    const EdgeWeight& edge_weight(NodeIdx source, NodeIdx target) const;

    /**
     * @brief Size of a node, by short name.
     * @return The (normalized, once `normalize_sizes()` ran) size, or `std::nullopt` if
     *         the short name is not in the size table.
     * @throw CrateGraphError with `InvalidNodeIndex` if the node is not live.
     */
    std::optional<size_t> size_of(NodeIdx idx) const;

    const SizeTable& size_table() const noexcept
    {
        return m_sizes;
    }

    // -------------------------------------------------------------------------
    // Traversals
    // -------------------------------------------------------------------------

    /**
     * @brief All live nodes, each dependent before its dependencies.
     * @throw CrateGraphError with `CycleDetected` if the graph is not acyclic.
     */
    std::vector<NodeIdx> topological_order() const;

    /// Nodes reachable from the root, in depth-first preorder.
    std::vector<NodeIdx> dfs() const;

    /// Nodes reachable from the root, in breadth-first order.
    std::vector<NodeIdx> bfs() const;

    // -------------------------------------------------------------------------
    // Mutation
    // -------------------------------------------------------------------------

    /**
     * @brief Make another node the root, then remove everything it does not reach.
     * @throw CrateGraphError with `InvalidNodeIndex` if the node is not live.
     */
    void change_root(NodeIdx new_root);

    /**
     * @brief Remove the given nodes and their edges, then remove everything no longer
     *        reachable from the root.
     *
     * @details
     * The std node is exempt and is skipped if listed. The index list is validated
     * before anything is removed.
     *
     * @throw CrateGraphError with `InvalidNodeIndex` if an index is not live, or
     *        `InvalidState` if the list contains the root.
     */
    void remove_nodes(const std::vector<NodeIdx>& indices);

    /**
     * @brief Remove every node more than `max_depth` edges away from the root.
     *
     * @details
     * Depth is the shortest distance from the root; `max_depth == 0` keeps only the
     * root (and the std node).
     */
    void remove_beyond_depth(size_t max_depth);

    /**
     * @brief Remove every node except the std node that the root does not reach.
     * @return The number of nodes removed. A second call returns 0.
     */
    size_t prune_unreachable();

private:
    struct NodeSlot
    {
        NodeWeight weight;
        std::vector<NodeIdx> outgoing;
        std::vector<NodeIdx> incoming;
    };

    SlotList<NodeSlot> m_nodes;

    /// Edge weights keyed by (source, target).
    std::map<std::pair<NodeIdx, NodeIdx>, EdgeWeight> m_edges;

    SizeTable m_sizes;
    bool m_sizes_normalized = false;

    NodeIdx m_root = 0;
    std::optional<NodeIdx> m_std;

    /// Throw `InvalidNodeIndex` unless the node is live.
    void require_node(NodeIdx idx) const;

    const NodeSlot& slot(NodeIdx idx) const;

    /// Iterative DFS along outgoing edges.
    bool is_reachable_from(NodeIdx from, NodeIdx target) const;

    /// Remove one node and its incident edges. No pruning.
    void remove_node(NodeIdx idx);

    /// Remove every node whose flag is false, except the std node.
    size_t remove_not_visited(const std::vector<bool>& visited);
};

} // namespace cratescope
