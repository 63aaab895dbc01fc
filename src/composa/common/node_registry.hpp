/**
 * @file node_registry.hpp
 */
#pragma once
#include "composa/common/common.hpp"
#include "composa/common/composition_types.hpp"
#include "composa/custody/asset_interfaces.hpp"

namespace composa
{

/**
 * @brief Identity layer for composability nodes.
 *
 * @details
 * `NodeRegistry` canonicalizes a node as (collection, token id) and interns it
 * to a stable small index (`NodeIdx`) in insertion order. The link graph and
 * the attachment ledger key their tables by that index, so removing or
 * replacing an edge is a table update rather than a pointer-graph rewrite.
 *
 * Existence is never cached: `exists()` asks the collection's collaborator on
 * every call, because a token can be burned independently of this engine.
 *
 * @par Index semantics
 * - Indices are assigned sequentially starting from 0.
 * - The index returned by `intern()` for a new node equals the previous `size()`.
 * - `npos` (value: `SIZE_MAX`) represents "not found" in `find()` results.
 * - Interning a node does not check existence; callers check `exists()` first.
 *
 * @par Invariants
 * - For all `i` in `[0, size())`: `find(at(i)) == i`.
 * - For any interned node `n`: `at(intern(n)) == n`.
 *
 * @par Exception safety
 * - `intern()` provides the strong exception guarantee.
 * - `find()`, `size()` and `exists()` for an unregistered collection do not throw.
 *
 * @par Thread safety
 * - No internal synchronization; not thread-safe.
 */
class NodeRegistry
{
public:
    /**
     * @brief Sentinel value indicating "not found" (equal to `SIZE_MAX`).
     */
    static constexpr std::size_t npos = ~static_cast<std::size_t>(0);

public:
    /**
     * @brief Register the collaborator that owns a collection.
     * @throw std::invalid_argument if `asset` is null or its address is empty.
     * @note Re-registering an address replaces the previous collaborator.
     */
    void register_collection(NonFungibleAssetPtr asset);

    /**
     * @brief Get the collaborator for a collection.
     * @return The collaborator, or nullptr if the collection is not registered.
     */
    NonFungibleAssetPtr collection(const Address& address) const noexcept;

    /**
     * @brief Check whether a node currently exists.
     * @return True iff the collection is registered and its ownership query
     *         reports a holder for the token.
     * @note A collaborator whose ownership query throws is treated as
     *       reporting non-existence.
     */
    bool exists(const NodeId& node) const noexcept;

    /**
     * @brief Current holder of a node, as reported by its collaborator.
     * @return The holder, or `std::nullopt` if the node does not exist.
     */
    std::optional<Address> holder_of(const NodeId& node) const;

    /**
     * @brief Intern a node, returning its stable index.
     * @param node The node to intern. Its collection address must not be empty.
     * @return The index of the node: new index if first seen, existing otherwise.
     * @throw std::invalid_argument if the collection address is empty.
     */
    NodeIdx intern(const NodeId& node);

    /**
     * @brief Find the index of an interned node.
     * @return The index if interned; otherwise, `npos`.
     */
    NodeIdx find(const NodeId& node) const noexcept;

    /**
     * @brief Access the node at the given index.
     * @throw std::out_of_range if `index >= size()`.
     */
    const NodeId& at(NodeIdx index) const;

    /**
     * @brief Number of interned nodes.
     */
    std::size_t size() const noexcept
    {
        return m_nodes.size();
    }

    /**
     * @brief Enumerate all interned nodes in insertion order.
     * @tparam Func A callable type with signature `void(NodeIdx, const NodeId&)`.
     * @warning Do not intern from inside the callback; behavior is undefined.
     */
    template <typename Func>
    void enumerate(Func&& func) const
    {
        static_assert(std::is_invocable_v<Func&, NodeIdx, const NodeId&>,
            "Func must be callable as f(NodeIdx, const NodeId&)");
        const size_t count = m_nodes.size();
        for (NodeIdx idx = 0u; idx < count; ++idx)
        {
            func(idx, m_nodes[idx]);
        }
    }

private:
    std::vector<NodeId> m_nodes;
    std::unordered_map<NodeId, NodeIdx> m_index;
    std::unordered_map<Address, NonFungibleAssetPtr> m_collections;
};

} // namespace composa
