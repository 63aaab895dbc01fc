/**
 * @file exported_composition.hpp
 */
#pragma once
#include "composa/common/common.hpp"
#include "composa/common/composition_types.hpp"

namespace composa
{

// ============================================================================
// Index-level snapshot
// ============================================================================

/**
 * @brief A snapshot of a LinkGraph, keyed by node index.
 *
 * @details
 * Produced by `LinkGraph::export_graph()` and accepted by
 * `LinkGraph::restore()`. The members are non-const so that upstream code can
 * move the vectors out instead of copying them.
 */
struct ExportedGraph
{
    /// Number of participant nodes known to the graph.
    size_t node_count{0};

    /// Every edge, as (source, target), sorted by source.
    std::vector<EdgePair> edges;

    /// Resolved root of every node, indexed by NodeIdx.
    std::vector<NodeIdx> roots;
};

// ============================================================================
// Identity-level snapshot
// ============================================================================

/**
 * @brief An edge expressed with node identities.
 */
struct EdgeRecord
{
    NodeId source;
    NodeId target;
};

/**
 * @brief A resolved root expressed with node identities.
 */
struct RootRecord
{
    NodeId node;
    NodeId root;
};

/**
 * @brief One non-zero attachment: (resource, owner node) -> amount.
 */
struct AttachmentRecord
{
    ResourceKey resource;
    NodeId owner;
    Amount amount{0};
};

/**
 * @brief A snapshot of the whole composition state.
 *
 * @details
 * Mirrors the two persisted tables, Edges(source -> target) and
 * Attachments(kind, key, owner -> amount), plus the derived roots and the
 * per-resource totals. Produced by `Composer::export_state()`.
 */
struct ExportedComposition
{
    std::vector<EdgeRecord> edges;
    std::vector<RootRecord> roots;
    std::vector<AttachmentRecord> attachments;
    std::map<ResourceKey, Amount> totals;
};

} // namespace composa
