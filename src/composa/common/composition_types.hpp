/**
 * @file composition_types.hpp
 */
#pragma once
#include "composa/common/common.hpp"

namespace composa
{

// ============================================================================
// Scalar type aliases
// ============================================================================

/**
 * @brief Type alias for account and contract addresses.
 *
 * @details
 * Addresses are opaque strings. The engine compares them for equality and
 * never interprets their content. An empty address is never valid.
 */
using Address = std::string;

/**
 * @brief Type alias for per-collection numeric token ids.
 */
using TokenId = std::uint64_t;

/**
 * @brief Type alias for fungible and counted-asset quantities.
 *
 * @details
 * Signed so that a negative quantity supplied by a caller can be reported
 * as `InvalidAmount` instead of wrapping around.
 */
using Amount = std::int64_t;

/**
 * @brief Opaque caller-supplied bytes carried by every notification.
 */
using Bytes = std::vector<std::uint8_t>;

/**
 * @brief Type alias for interned node indices.
 *
 * @details
 * `NodeIdx` is a type alias for `size_t` used to identify participant nodes
 * inside the link graph and the attachment ledger. Indices are assigned by
 * `NodeRegistry::intern()` in insertion order starting from 0. This alias
 * exists for clarity in API signatures, not for compile-time type safety.
 */
using NodeIdx = size_t;

/**
 * @brief An edge of the link graph, as (source, target).
 */
using EdgePair = std::pair<NodeIdx, NodeIdx>;

// ============================================================================
// Node identity
// ============================================================================

/**
 * @brief Identity of a non-fungible node: (collection address, token id).
 *
 * @details
 * Nodes are minted by the external asset collaborator. The engine never
 * creates them; a node becomes a participant the first time it is seen.
 */
struct NodeId
{
    Address collection;
    TokenId token_id{};

    bool operator==(const NodeId& other) const noexcept
    {
        return token_id == other.token_id && collection == other.collection;
    }

    bool operator!=(const NodeId& other) const noexcept
    {
        return !(*this == other);
    }

    bool operator<(const NodeId& other) const noexcept
    {
        return std::tie(collection, token_id) < std::tie(other.collection, other.token_id);
    }
};

/**
 * @brief Format a node as "collection#id".
 */
inline std::string to_string(const NodeId& node)
{
    return node.collection + "#" + std::to_string(node.token_id);
}

// ============================================================================
// Resources
// ============================================================================

/**
 * @brief Kind of resource a graph operation moves.
 *
 * @details
 * `NonFungible` covers nodes themselves (edges of the link graph).
 * `Currency` and `CountedAsset` cover the leaf attachments kept by the
 * attachment ledger.
 */
enum class ResourceKind
{
    NonFungible,
    Currency,
    CountedAsset
};

/**
 * @brief Name of a resource kind, for messages and logs.
 */
inline const char* to_string(ResourceKind kind) noexcept
{
    switch (kind)
    {
    case ResourceKind::NonFungible:
        return "NonFungible";
    case ResourceKind::Currency:
        return "Currency";
    case ResourceKind::CountedAsset:
        return "CountedAsset";
    }
    return "Unknown";
}

/**
 * @brief Identifies one fungible resource held in attachments.
 *
 * @details
 * - For `Currency`, `contract` is the currency contract and `asset_id` is 0.
 * - For `CountedAsset`, `contract` is the multi-asset collection and
 *   `asset_id` selects the asset within it.
 *
 * Use the `currency()` and `counted()` factories; they keep `asset_id`
 * canonical for currencies.
 */
struct ResourceKey
{
    ResourceKind kind{ResourceKind::Currency};
    Address contract;
    TokenId asset_id{};

    static ResourceKey currency(Address contract)
    {
        return ResourceKey{ResourceKind::Currency, std::move(contract), 0};
    }

    static ResourceKey counted(Address contract, TokenId asset_id)
    {
        return ResourceKey{ResourceKind::CountedAsset, std::move(contract), asset_id};
    }

    bool operator==(const ResourceKey& other) const noexcept
    {
        return kind == other.kind && asset_id == other.asset_id && contract == other.contract;
    }

    bool operator!=(const ResourceKey& other) const noexcept
    {
        return !(*this == other);
    }

    bool operator<(const ResourceKey& other) const noexcept
    {
        return std::tie(kind, contract, asset_id) <
               std::tie(other.kind, other.contract, other.asset_id);
    }
};

/**
 * @brief Format a resource key as "Currency:contract" or "CountedAsset:contract#id".
 */
inline std::string to_string(const ResourceKey& key)
{
    std::string result = std::string(to_string(key.kind)) + ":" + key.contract;
    if (key.kind == ResourceKind::CountedAsset)
    {
        result += "#" + std::to_string(key.asset_id);
    }
    return result;
}

} // namespace composa

namespace std
{

template <>
struct hash<composa::NodeId>
{
    size_t operator()(const composa::NodeId& node) const noexcept
    {
        size_t h = std::hash<std::string>{}(node.collection);
        return h ^ (std::hash<std::uint64_t>{}(node.token_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

template <>
struct hash<composa::ResourceKey>
{
    size_t operator()(const composa::ResourceKey& key) const noexcept
    {
        size_t h = std::hash<std::string>{}(key.contract);
        h ^= std::hash<std::uint64_t>{}(key.asset_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= static_cast<size_t>(key.kind) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace std
