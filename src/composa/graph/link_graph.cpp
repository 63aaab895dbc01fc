/**
 * @file link_graph.cpp
 */
#include "composa/graph/link_graph.hpp"

#include <queue>

#include <spdlog/spdlog.h>

namespace composa
{

// ============================================================================
// Constructor
// ============================================================================

LinkGraph::LinkGraph(LinkGraphConfig config)
    : m_config(config)
{
    if (m_config.max_depth == 0)
    {
        throw std::invalid_argument("LinkGraph: max_depth must be positive");
    }
}

// ============================================================================
// Query methods
// ============================================================================

size_t LinkGraph::node_count() const noexcept
{
    return m_targets.size();
}

size_t LinkGraph::edge_count() const noexcept
{
    return m_edge_count;
}

// ============================================================================
// Node management
// ============================================================================

void LinkGraph::add_node(NodeIdx node_idx)
{
    if (node_idx != m_targets.size())
    {
        throw CompositionError(
            CompositionErrorCode::NotFound,
            "Node index " + std::to_string(node_idx) + " is out of sequence; expected " +
                std::to_string(m_targets.size()));
    }
    m_children.emplace_back();
    m_targets.push_back(kNoTarget);
}

// ============================================================================
// Linking
// ============================================================================

void LinkGraph::validate_link(NodeIdx source, NodeIdx target) const
{
    check_node(source, "Source");
    check_node(target, "Target");
    check_not_quarantined(source);
    check_not_quarantined(target);

    if (source == target)
    {
        throw CompositionError(
            CompositionErrorCode::SelfLink,
            "Cannot link node " + std::to_string(source) + " to itself");
    }
    if (m_targets[source] != kNoTarget)
    {
        throw CompositionError(
            CompositionErrorCode::AlreadyLinked,
            "Node " + std::to_string(source) + " is already linked to node " +
                std::to_string(m_targets[source]) + "; use update_target to re-parent");
    }
    size_t target_depth = check_no_cycle(source, target);
    check_chain_length(source, target, target_depth);
}

void LinkGraph::link(NodeIdx source, NodeIdx target)
{
    validate_link(source, target);

    m_children[target].insert(source);
    m_targets[source] = target;
    ++m_edge_count;
}

void LinkGraph::validate_update_target(NodeIdx source, NodeIdx new_target) const
{
    check_node(source, "Source");
    check_node(new_target, "Target");
    check_not_quarantined(source);
    check_not_quarantined(new_target);

    if (m_targets[source] == kNoTarget)
    {
        throw CompositionError(
            CompositionErrorCode::NotLinked,
            "Node " + std::to_string(source) + " has no target; use link instead");
    }
    if (source == new_target)
    {
        throw CompositionError(
            CompositionErrorCode::SelfLink,
            "Cannot retarget node " + std::to_string(source) + " to itself");
    }
    // The old edge out of source is only reachable through source itself,
    // so walking from new_target over the current table is equivalent to
    // walking with the old edge removed. The same holds for the depth of
    // new_target once the walk has not met source.
    size_t target_depth = check_no_cycle(source, new_target);
    check_chain_length(source, new_target, target_depth);
}

void LinkGraph::update_target(NodeIdx source, NodeIdx new_target)
{
    validate_update_target(source, new_target);

    NodeIdx old_target = m_targets[source];
    if (old_target == new_target)
    {
        return;
    }
    m_children[new_target].insert(source);
    m_children[old_target].erase(source);
    m_targets[source] = new_target;
}

void LinkGraph::validate_unlink(NodeIdx source) const
{
    check_node(source, "Source");
    check_not_quarantined(source);

    if (m_targets[source] == kNoTarget)
    {
        throw CompositionError(
            CompositionErrorCode::NotLinked,
            "Node " + std::to_string(source) + " has no target to unlink");
    }
}

void LinkGraph::unlink(NodeIdx source)
{
    validate_unlink(source);

    m_children[m_targets[source]].erase(source);
    m_targets[source] = kNoTarget;
    --m_edge_count;
}

// ============================================================================
// Root resolution
// ============================================================================

template <typename Visit>
NodeIdx LinkGraph::walk_to_root(NodeIdx start, Visit&& visit) const
{
    std::vector<NodeIdx> walked;
    NodeIdx current = start;
    size_t hops = 0;
    while (true)
    {
        walked.push_back(current);
        visit(current);
        NodeIdx next = m_targets[current];
        if (next == kNoTarget)
        {
            return current;
        }
        if (++hops > m_config.max_depth)
        {
            m_quarantined.insert(walked.begin(), walked.end());
            SPDLOG_ERROR("Root resolution from node {} exceeded {} hops; quarantined {} node(s)",
                         start, m_config.max_depth, walked.size());
            throw CompositionError(
                CompositionErrorCode::GraphCorrupted,
                "Root resolution from node " + std::to_string(start) + " exceeded " +
                    std::to_string(m_config.max_depth) + " hops");
        }
        current = next;
    }
}

size_t LinkGraph::check_no_cycle(NodeIdx source, NodeIdx target) const
{
    size_t visited_count = 0;
    walk_to_root(target, [&](NodeIdx visited) {
        if (visited == source)
        {
            throw CompositionError(
                CompositionErrorCode::CycleDetected,
                "Linking node " + std::to_string(source) + " to node " +
                    std::to_string(target) + " would create a cycle (node " +
                    std::to_string(source) + " is an ancestor of node " +
                    std::to_string(target) + ")");
        }
        ++visited_count;
    });
    return visited_count - 1;
}

void LinkGraph::check_chain_length(NodeIdx source, NodeIdx target, size_t target_depth) const
{
    // The deepest node under source ends up target_depth + 1 + height hops
    // from its root.
    const size_t max_depth = m_config.max_depth;
    size_t budget = target_depth < max_depth ? max_depth - target_depth - 1 : 0;
    if (target_depth >= max_depth || subtree_height(source, budget) > budget)
    {
        throw CompositionError(
            CompositionErrorCode::DepthLimitExceeded,
            "Linking node " + std::to_string(source) + " to node " + std::to_string(target) +
                " would create a chain longer than " + std::to_string(max_depth) + " hops");
    }
}

size_t LinkGraph::subtree_height(NodeIdx node, size_t limit) const
{
    std::vector<NodeIdx> level{node};
    size_t height = 0;
    while (true)
    {
        std::vector<NodeIdx> next;
        for (NodeIdx current : level)
        {
            next.insert(next.end(), m_children[current].begin(), m_children[current].end());
        }
        if (next.empty())
        {
            return height;
        }
        if (++height > limit)
        {
            return height;
        }
        level = std::move(next);
    }
}

NodeIdx LinkGraph::find_root(NodeIdx node) const
{
    check_node(node, "Node");
    return walk_to_root(node, [](NodeIdx) {});
}

std::optional<NodeIdx> LinkGraph::get_target(NodeIdx node) const
{
    check_node(node, "Node");
    if (m_targets[node] == kNoTarget)
    {
        return std::nullopt;
    }
    return m_targets[node];
}

std::vector<NodeIdx> LinkGraph::children(NodeIdx node) const
{
    check_node(node, "Node");
    return std::vector<NodeIdx>(m_children[node].begin(), m_children[node].end());
}

size_t LinkGraph::depth(NodeIdx node) const
{
    check_node(node, "Node");
    size_t hops = 0;
    walk_to_root(node, [&](NodeIdx) { ++hops; });
    return hops - 1;
}

std::vector<NodeIdx> LinkGraph::subtree(NodeIdx node) const
{
    check_node(node, "Node");
    std::vector<NodeIdx> result;
    std::vector<bool> seen(m_targets.size(), false);
    seen[node] = true;
    std::queue<NodeIdx> pending;
    pending.push(node);
    while (!pending.empty())
    {
        NodeIdx current = pending.front();
        pending.pop();
        for (NodeIdx child : m_children[current])
        {
            if (!seen[child])
            {
                seen[child] = true;
                result.push_back(child);
                pending.push(child);
            }
        }
    }
    return result;
}

// ============================================================================
// Quarantine
// ============================================================================

bool LinkGraph::is_quarantined(NodeIdx node) const noexcept
{
    return m_quarantined.count(node) != 0;
}

bool LinkGraph::clear_quarantine(NodeIdx node) noexcept
{
    return m_quarantined.erase(node) != 0;
}

std::vector<NodeIdx> LinkGraph::quarantined_nodes() const
{
    return std::vector<NodeIdx>(m_quarantined.begin(), m_quarantined.end());
}

// ============================================================================
// Diagnostics
// ============================================================================

std::shared_ptr<CompositionDiagnostics> LinkGraph::get_diagnostics() const
{
    auto diagnostics = std::make_shared<CompositionDiagnostics>();
    const size_t count = m_targets.size();

    // =========================================================================
    // Phase 1: Reverse index coherence
    // =========================================================================

    for (NodeIdx source = 0; source < count; ++source)
    {
        NodeIdx target = m_targets[source];
        if (target == kNoTarget)
        {
            continue;
        }
        if (target >= count || m_children[target].count(source) == 0)
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Error;
            item.category = DiagnosticCategory::ReverseIndexMismatch;
            item.message = "Edge " + std::to_string(source) + " -> " + std::to_string(target) +
                           " is missing from the children index";
            item.involved_nodes = {source, target};
            diagnostics->add(std::move(item));
        }
    }
    for (NodeIdx target = 0; target < count; ++target)
    {
        for (NodeIdx child : m_children[target])
        {
            if (child >= count || m_targets[child] != target)
            {
                DiagnosticItem item;
                item.severity = DiagnosticSeverity::Error;
                item.category = DiagnosticCategory::ReverseIndexMismatch;
                item.message = "Children index lists node " + std::to_string(child) +
                               " under node " + std::to_string(target) +
                               " but its target differs";
                item.involved_nodes = {child, target};
                diagnostics->add(std::move(item));
            }
        }
    }

    // =========================================================================
    // Phase 2: Cycle detection and depth computation
    // =========================================================================

    // Every node has out-degree <= 1, so following targets from each node
    // either ends at a root or enters exactly one cycle.
    enum class Mark : std::uint8_t { Unvisited, OnPath, Done };
    constexpr size_t kUnbounded = ~static_cast<size_t>(0);
    std::vector<Mark> marks(count, Mark::Unvisited);
    std::vector<size_t> depths(count, 0);

    for (NodeIdx start = 0; start < count; ++start)
    {
        if (marks[start] != Mark::Unvisited)
        {
            continue;
        }
        std::vector<NodeIdx> path;
        NodeIdx current = start;
        size_t base_depth = 0;
        while (true)
        {
            if (current == kNoTarget || current >= count)
            {
                base_depth = 0;
                break;
            }
            if (marks[current] == Mark::Done)
            {
                base_depth = depths[current] == kUnbounded ? kUnbounded : depths[current] + 1;
                break;
            }
            if (marks[current] == Mark::OnPath)
            {
                auto cycle_begin = std::find(path.begin(), path.end(), current);
                DiagnosticItem item;
                item.severity = DiagnosticSeverity::Error;
                item.category = DiagnosticCategory::Cycle;
                item.involved_nodes.assign(cycle_begin, path.end());
                item.message = "Cycle of " + std::to_string(item.involved_nodes.size()) +
                               " node(s) through node " + std::to_string(current);
                diagnostics->add(std::move(item));
                base_depth = kUnbounded;
                break;
            }
            marks[current] = Mark::OnPath;
            path.push_back(current);
            current = m_targets[current];
        }

        // Assign depths from the end of the path back to its start.
        size_t next_depth = base_depth;
        for (auto it = path.rbegin(); it != path.rend(); ++it)
        {
            depths[*it] = next_depth;
            marks[*it] = Mark::Done;
            if (next_depth != kUnbounded)
            {
                ++next_depth;
            }
        }
    }

    // =========================================================================
    // Phase 3: Depth bounds
    // =========================================================================

    std::vector<NodeIdx> too_deep;
    std::vector<NodeIdx> deep;
    for (NodeIdx node = 0; node < count; ++node)
    {
        if (depths[node] == kUnbounded)
        {
            continue;
        }
        if (depths[node] > m_config.max_depth)
        {
            too_deep.push_back(node);
        }
        else if (depths[node] > m_config.deep_chain_warning)
        {
            deep.push_back(node);
        }
    }
    if (!too_deep.empty())
    {
        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Error;
        item.category = DiagnosticCategory::DepthExceeded;
        item.message = std::to_string(too_deep.size()) + " node(s) are more than " +
                       std::to_string(m_config.max_depth) + " hops from their root";
        item.involved_nodes = std::move(too_deep);
        diagnostics->add(std::move(item));
    }
    if (!deep.empty())
    {
        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Warning;
        item.category = DiagnosticCategory::DeepChain;
        item.message = std::to_string(deep.size()) + " node(s) are more than " +
                       std::to_string(m_config.deep_chain_warning) + " hops from their root";
        item.involved_nodes = std::move(deep);
        diagnostics->add(std::move(item));
    }

    // =========================================================================
    // Phase 4: Quarantine
    // =========================================================================

    if (!m_quarantined.empty())
    {
        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Warning;
        item.category = DiagnosticCategory::Quarantined;
        item.message = std::to_string(m_quarantined.size()) + " node(s) are quarantined";
        item.involved_nodes.assign(m_quarantined.begin(), m_quarantined.end());
        diagnostics->add(std::move(item));
    }

    return diagnostics;
}

// ============================================================================
// Export and restore
// ============================================================================

std::shared_ptr<ExportedGraph> LinkGraph::export_graph() const
{
    auto exported = std::make_shared<ExportedGraph>();
    const size_t count = m_targets.size();
    exported->node_count = count;
    exported->edges.reserve(m_edge_count);
    exported->roots.reserve(count);
    for (NodeIdx node = 0; node < count; ++node)
    {
        if (m_targets[node] != kNoTarget)
        {
            exported->edges.emplace_back(node, m_targets[node]);
        }
        exported->roots.push_back(find_root(node));
    }
    return exported;
}

void LinkGraph::restore(const ExportedGraph& snapshot, bool verify)
{
    LinkGraph staged(m_config);
    for (NodeIdx node = 0; node < snapshot.node_count; ++node)
    {
        staged.add_node(node);
    }
    for (const auto& [source, target] : snapshot.edges)
    {
        if (source >= snapshot.node_count || target >= snapshot.node_count)
        {
            throw CompositionError(
                CompositionErrorCode::NotFound,
                "Snapshot edge " + std::to_string(source) + " -> " + std::to_string(target) +
                    " references a node outside the snapshot");
        }
        if (source == target)
        {
            throw CompositionError(
                CompositionErrorCode::SelfLink,
                "Snapshot edge links node " + std::to_string(source) + " to itself");
        }
        if (staged.m_targets[source] != kNoTarget)
        {
            throw CompositionError(
                CompositionErrorCode::AlreadyLinked,
                "Snapshot has more than one edge out of node " + std::to_string(source));
        }
        staged.m_targets[source] = target;
        staged.m_children[target].insert(source);
        ++staged.m_edge_count;
    }

    if (verify)
    {
        auto diagnostics = staged.get_diagnostics();
        if (diagnostics->has_errors())
        {
            const auto& first = diagnostics->errors().front();
            throw CompositionError(
                CompositionErrorCode::GraphCorrupted,
                "Snapshot failed verification with " +
                    std::to_string(diagnostics->errors().size()) + " error(s); first: " +
                    first.message);
        }
    }

    m_targets = std::move(staged.m_targets);
    m_children = std::move(staged.m_children);
    m_edge_count = staged.m_edge_count;
    m_quarantined.clear();
}

// ============================================================================
// Helpers
// ============================================================================

void LinkGraph::check_node(NodeIdx node, const char* role) const
{
    if (node >= m_targets.size())
    {
        throw CompositionError(
            CompositionErrorCode::NotFound,
            std::string(role) + " index " + std::to_string(node) + " does not exist");
    }
}

void LinkGraph::check_not_quarantined(NodeIdx node) const
{
    if (m_quarantined.count(node) != 0)
    {
        throw CompositionError(
            CompositionErrorCode::GraphCorrupted,
            "Node " + std::to_string(node) + " is quarantined after a failed root resolution");
    }
}

} // namespace composa
