#include "composa/common/node_registry.hpp"

namespace composa
{

void NodeRegistry::register_collection(NonFungibleAssetPtr asset)
{
    if (!asset)
    {
        throw std::invalid_argument("NodeRegistry::register_collection: null collaborator");
    }
    if (asset->address().empty())
    {
        throw std::invalid_argument("NodeRegistry::register_collection: empty collection address");
    }
    Address address = asset->address();
    m_collections[address] = std::move(asset);
}

NonFungibleAssetPtr NodeRegistry::collection(const Address& address) const noexcept
{
    auto it = m_collections.find(address);
    if (it == m_collections.end())
    {
        return nullptr;
    }
    return it->second;
}

bool NodeRegistry::exists(const NodeId& node) const noexcept
{
    auto asset = collection(node.collection);
    if (!asset)
    {
        return false;
    }
    try
    {
        return asset->owner_of(node.token_id).has_value();
    }
    catch (const std::exception&)
    {
        // A failing ownership query means the token does not exist.
        return false;
    }
}

std::optional<Address> NodeRegistry::holder_of(const NodeId& node) const
{
    auto asset = collection(node.collection);
    if (!asset)
    {
        return std::nullopt;
    }
    return asset->owner_of(node.token_id);
}

NodeIdx NodeRegistry::intern(const NodeId& node)
{
    if (node.collection.empty())
    {
        throw std::invalid_argument("NodeRegistry::intern: empty collection address");
    }
    auto it = m_index.find(node);
    if (it != m_index.end())
    {
        return it->second;
    }
    NodeIdx index = m_nodes.size();
    m_nodes.push_back(node);
    try
    {
        m_index.emplace(node, index);
    }
    catch (...)
    {
        m_nodes.pop_back();
        throw;
    }
    return index;
}

NodeIdx NodeRegistry::find(const NodeId& node) const noexcept
{
    auto it = m_index.find(node);
    if (it != m_index.end())
    {
        return it->second;
    }
    return npos;
}

const NodeId& NodeRegistry::at(NodeIdx index) const
{
    if (index >= m_nodes.size())
    {
        throw std::out_of_range("NodeRegistry::at: index out of range");
    }
    return m_nodes[index];
}

} // namespace composa
