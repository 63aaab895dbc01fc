/**
 * @file link_graph.hpp
 */
#pragma once
#include "composa/common/common.hpp"
#include "composa/common/composition_types.hpp"
#include "composa/common/composition_exceptions.hpp"
#include "composa/graph/link_graph_diagnostics.hpp"
#include "composa/graph/exported_composition.hpp"

namespace composa
{

/**
 * @brief Configuration for LinkGraph behavior.
 */
struct LinkGraphConfig
{
    /**
     * @brief Maximum number of target hops a root-ward walk may take.
     * @details A walk that needs more hops fails with `GraphCorrupted`.
     */
    size_t max_depth{4096};

    /**
     * @brief Depth above which diagnostics report a `DeepChain` warning.
     */
    size_t deep_chain_warning{64};
};

/**
 * @brief The composability forest: parent pointers plus reverse adjacency.
 *
 * @details
 * `LinkGraph` stores, for every participant node, at most one target (its
 * parent in forest terms) and the ordered set of nodes targeting it. Nodes are
 * identified by `NodeIdx`; the caller maps identities to indices (see
 * `NodeRegistry`) and registers each index with `add_node()` before use.
 *
 * @par Invariants
 * - Every node has at most one outgoing edge.
 * - The target relation is acyclic, so it is a forest of edges pointing from
 *   child to parent.
 * - `s` is in `children(t)` iff `get_target(s) == t`.
 *
 * @par Root resolution
 * Roots are never stored. `find_root()` walks target pointers on every call,
 * which costs O(depth). `link()` and `update_target()` refuse any edge that
 * would put a node more than `LinkGraphConfig::max_depth` hops from its
 * root, so a graph built through them always resolves. Every root-ward walk
 * is still bounded by `max_depth`; exceeding the bound can only happen on a
 * graph loaded with `restore(snapshot, false)`, and raises `GraphCorrupted`
 * and quarantines every node the walk visited.
 *
 * @par Quarantine
 * Mutations whose source or target is quarantined fail with `GraphCorrupted`
 * until `clear_quarantine()` is called for that node. Queries are not blocked.
 *
 * @par Exception safety
 * Every mutating method either succeeds or throws `CompositionError` with the
 * graph unchanged (the quarantine set aside).
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent access requires external synchronization. Const methods may
 *   update the quarantine set, so they are not safe to call concurrently
 *   either.
 */
class LinkGraph
{
public:
    /**
     * @brief Constructor for LinkGraph.
     * @param config Root resolution bound and diagnostics threshold.
     * @throw std::invalid_argument if `config.max_depth` is zero.
     */
    explicit LinkGraph(LinkGraphConfig config = LinkGraphConfig{});

    const LinkGraphConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Get the current number of participant nodes.
     * @return The count of nodes added via `add_node()`.
     */
    size_t node_count() const noexcept;

    /**
     * @brief Get the current number of edges.
     */
    size_t edge_count() const noexcept;

    /**
     * @brief Add a participant node to the graph.
     * @param node_idx Index of the node to add. Must equal the current `node_count()`.
     * @throw CompositionError with `NotFound` if node_idx is out of sequence.
     */
    void add_node(NodeIdx node_idx);

    // -------------------------------------------------------------------------
    // Mutations
    // -------------------------------------------------------------------------

    /**
     * @brief Check every precondition of `link()` without mutating.
     * @throw CompositionError as `link()` would.
     */
    void validate_link(NodeIdx source, NodeIdx target) const;

    /**
     * @brief Create the edge source -> target.
     * @throw CompositionError with `NotFound` if either index is unknown,
     *        `SelfLink` if source == target, `AlreadyLinked` if the source has
     *        a target, `CycleDetected` if target's root-ward walk reaches
     *        source, `DepthLimitExceeded` if the edge would put a node more
     *        than `max_depth` hops from its root, or `GraphCorrupted` if
     *        either node is quarantined or the walk exceeds the bound.
     */
    void link(NodeIdx source, NodeIdx target);

    /**
     * @brief Check every precondition of `update_target()` without mutating.
     * @throw CompositionError as `update_target()` would.
     */
    void validate_update_target(NodeIdx source, NodeIdx new_target) const;

    /**
     * @brief Replace the edge out of source with source -> new_target.
     * @throw CompositionError with `NotFound` if either index is unknown,
     *        `NotLinked` if the source has no target, `SelfLink` if
     *        source == new_target, `CycleDetected` if new_target's root-ward
     *        walk reaches source, `DepthLimitExceeded` as for `link()`, or
     *        `GraphCorrupted` as for `link()`.
     * @note Retargeting to the current target is accepted and leaves the
     *       graph as it was.
     */
    void update_target(NodeIdx source, NodeIdx new_target);

    /**
     * @brief Check every precondition of `unlink()` without mutating.
     * @throw CompositionError as `unlink()` would.
     */
    void validate_unlink(NodeIdx source) const;

    /**
     * @brief Remove the edge out of source. Source becomes its own root.
     * @throw CompositionError with `NotFound` if the index is unknown,
     *        `NotLinked` if the source has no target, or `GraphCorrupted` if
     *        the source is quarantined.
     */
    void unlink(NodeIdx source);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    /**
     * @brief Resolve the root of a node.
     * @return The node reached by following targets until none remains. A node
     *         with no target is its own root.
     * @throw CompositionError with `NotFound` if the index is unknown, or
     *        `GraphCorrupted` if the walk exceeds `max_depth` hops.
     */
    NodeIdx find_root(NodeIdx node) const;

    /**
     * @brief Single-hop read of a node's target.
     * @throw CompositionError with `NotFound` if the index is unknown.
     */
    std::optional<NodeIdx> get_target(NodeIdx node) const;

    /**
     * @brief Nodes whose target is `node`, in ascending index order.
     * @throw CompositionError with `NotFound` if the index is unknown.
     */
    std::vector<NodeIdx> children(NodeIdx node) const;

    /**
     * @brief Number of hops from `node` to its root.
     * @throw CompositionError as `find_root()` would.
     */
    size_t depth(NodeIdx node) const;

    /**
     * @brief All descendants of `node`, breadth-first, excluding `node` itself.
     * @throw CompositionError with `NotFound` if the index is unknown.
     */
    std::vector<NodeIdx> subtree(NodeIdx node) const;

    // -------------------------------------------------------------------------
    // Quarantine
    // -------------------------------------------------------------------------

    bool is_quarantined(NodeIdx node) const noexcept;

    /**
     * @brief Release a node from quarantine after manual investigation.
     * @return True if the node was quarantined.
     */
    bool clear_quarantine(NodeIdx node) noexcept;

    /**
     * @brief Quarantined nodes, in ascending index order.
     */
    std::vector<NodeIdx> quarantined_nodes() const;

    // -------------------------------------------------------------------------
    // Audit, export and restore
    // -------------------------------------------------------------------------

    /**
     * @brief Audit the forest invariants from scratch.
     * @return Diagnostics with Cycle, ReverseIndexMismatch and DepthExceeded
     *         errors, and DeepChain and Quarantined warnings.
     * @note Never throws `CompositionError`, even on a corrupted graph.
     */
    std::shared_ptr<CompositionDiagnostics> get_diagnostics() const;

    /**
     * @brief Export the edges and the resolved root of every node.
     * @throw CompositionError with `GraphCorrupted` if a root cannot be resolved.
     */
    std::shared_ptr<ExportedGraph> export_graph() const;

    /**
     * @brief Replace the whole graph with a previously exported snapshot.
     * @param snapshot Node count and edges to load; `roots` is ignored.
     * @param verify If true, the snapshot is audited before it is installed.
     *        Passing false loads a suspect snapshot as-is for inspection.
     * @throw CompositionError with `NotFound` for an out-of-range index,
     *        `SelfLink` for a self edge, `AlreadyLinked` for a second edge out
     *        of the same source, or (when verifying) `GraphCorrupted` if the
     *        audit reports errors. The graph is unchanged on failure.
     * @note A successful restore clears the quarantine set.
     */
    void restore(const ExportedGraph& snapshot, bool verify = true);

private:
    static constexpr NodeIdx kNoTarget = ~static_cast<NodeIdx>(0);

    // -------------------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------------------

    LinkGraphConfig m_config;

    // -------------------------------------------------------------------------
    // Edge tables
    // -------------------------------------------------------------------------

    /// Target of each node, or kNoTarget. Indexed by node index.
    std::vector<NodeIdx> m_targets;

    /// Sources targeting each node. Indexed by node index.
    std::vector<std::set<NodeIdx>> m_children;

    /// Number of nodes with a target.
    size_t m_edge_count = 0;

    /// Nodes visited by a walk that exceeded the bound.
    mutable std::set<NodeIdx> m_quarantined;

    // -------------------------------------------------------------------------
    // Helpers
    // -------------------------------------------------------------------------

    void check_node(NodeIdx node, const char* role) const;
    void check_not_quarantined(NodeIdx node) const;

    /// Throw CycleDetected if the root-ward walk from `target` reaches `source`.
    /// Return the depth of `target`.
    size_t check_no_cycle(NodeIdx source, NodeIdx target) const;

    /// Throw DepthLimitExceeded if hanging `source` and its subtree under a
    /// node at `target_depth` would put any node more than max_depth hops
    /// from its root.
    void check_chain_length(NodeIdx source, NodeIdx target, size_t target_depth) const;

    /// Height of the subtree under `node`, counted up to `limit + 1`.
    size_t subtree_height(NodeIdx node, size_t limit) const;

    /// Walk from `start` toward its root, calling visit(node) on every node
    /// including `start`; return the root. Quarantines the walk and throws
    /// GraphCorrupted past max_depth hops.
    template <typename Visit>
    NodeIdx walk_to_root(NodeIdx start, Visit&& visit) const;
};

} // namespace composa
