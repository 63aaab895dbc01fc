#include "composa/custody/in_memory_assets.hpp"

namespace composa
{

// ============================================================================
// ReceiverDirectory
// ============================================================================

void ReceiverDirectory::register_receiver(const Address& address, IAssetReceiver* receiver)
{
    if (address.empty() || receiver == nullptr)
    {
        throw std::invalid_argument("ReceiverDirectory::register_receiver: empty address or null receiver");
    }
    m_receivers[address] = receiver;
}

void ReceiverDirectory::unregister_receiver(const Address& address)
{
    m_receivers.erase(address);
}

IAssetReceiver* ReceiverDirectory::find(const Address& address) const noexcept
{
    auto it = m_receivers.find(address);
    return it != m_receivers.end() ? it->second : nullptr;
}

// ============================================================================
// InMemoryNonFungibleAsset
// ============================================================================

InMemoryNonFungibleAsset::InMemoryNonFungibleAsset(Address address)
    : m_address{std::move(address)}
{
}

std::optional<Address> InMemoryNonFungibleAsset::owner_of(TokenId token_id) const
{
    auto it = m_owners.find(token_id);
    if (it == m_owners.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryNonFungibleAsset::transfer_from(const Address& operator_address,
                                             const Address& from,
                                             const Address& to,
                                             TokenId token_id,
                                             const Bytes& data)
{
    auto it = m_owners.find(token_id);
    if (it == m_owners.end())
    {
        throw CustodyError(m_address + ": token " + std::to_string(token_id) + " does not exist");
    }
    if (it->second != from)
    {
        throw CustodyError(m_address + ": token " + std::to_string(token_id) +
                           " is not held by " + from);
    }
    if (to.empty())
    {
        throw CustodyError(m_address + ": transfer to the empty address");
    }
    if (operator_address != from && !is_approved_for_all(from, operator_address))
    {
        throw CustodyError(m_address + ": " + operator_address +
                           " is not approved to move tokens of " + from);
    }

    it->second = to;

    IAssetReceiver* receiver = m_receivers.find(to);
    if (receiver == nullptr)
    {
        return;
    }
    std::uint32_t ack = 0;
    try
    {
        ack = receiver->on_non_fungible_received(operator_address, from, token_id, data);
    }
    catch (...)
    {
        m_owners[token_id] = from;
        throw;
    }
    if (ack != kNonFungibleReceivedMagic)
    {
        m_owners[token_id] = from;
        throw CustodyError(m_address + ": receiver " + to + " rejected token " +
                           std::to_string(token_id));
    }
}

void InMemoryNonFungibleAsset::mint(const Address& to, TokenId token_id)
{
    if (to.empty())
    {
        throw CustodyError(m_address + ": mint to the empty address");
    }
    if (!m_owners.emplace(token_id, to).second)
    {
        throw CustodyError(m_address + ": token " + std::to_string(token_id) + " already minted");
    }
}

void InMemoryNonFungibleAsset::burn(TokenId token_id)
{
    if (m_owners.erase(token_id) == 0)
    {
        throw CustodyError(m_address + ": token " + std::to_string(token_id) + " does not exist");
    }
}

void InMemoryNonFungibleAsset::set_approval_for_all(const Address& owner,
                                                    const Address& operator_address,
                                                    bool approved)
{
    if (approved)
    {
        m_operator_approvals.emplace(owner, operator_address);
    }
    else
    {
        m_operator_approvals.erase({owner, operator_address});
    }
}

bool InMemoryNonFungibleAsset::is_approved_for_all(const Address& owner,
                                                   const Address& operator_address) const
{
    return m_operator_approvals.count({owner, operator_address}) != 0;
}

// ============================================================================
// InMemoryFungibleAsset
// ============================================================================

InMemoryFungibleAsset::InMemoryFungibleAsset(Address address)
    : m_address{std::move(address)}
{
}

Amount InMemoryFungibleAsset::balance_of(const Address& holder) const
{
    auto it = m_balances.find(holder);
    return it != m_balances.end() ? it->second : 0;
}

bool InMemoryFungibleAsset::transfer(const Address& from, const Address& to, Amount amount)
{
    return move_balance(from, to, amount);
}

bool InMemoryFungibleAsset::transfer_from(const Address& spender,
                                          const Address& from,
                                          const Address& to,
                                          Amount amount)
{
    if (spender == from)
    {
        return move_balance(from, to, amount);
    }
    auto it = m_allowances.find({from, spender});
    if (it == m_allowances.end() || it->second < amount)
    {
        return false;
    }
    if (!move_balance(from, to, amount))
    {
        return false;
    }
    it->second -= amount;
    return true;
}

void InMemoryFungibleAsset::mint(const Address& to, Amount amount)
{
    if (to.empty() || amount <= 0)
    {
        throw CustodyError(m_address + ": invalid mint");
    }
    if (m_total_supply > std::numeric_limits<Amount>::max() - amount)
    {
        throw CustodyError(m_address + ": total supply overflow");
    }
    m_balances[to] += amount;
    m_total_supply += amount;
}

void InMemoryFungibleAsset::approve(const Address& owner, const Address& spender, Amount amount)
{
    if (amount < 0)
    {
        throw CustodyError(m_address + ": negative allowance");
    }
    m_allowances[{owner, spender}] = amount;
}

Amount InMemoryFungibleAsset::allowance(const Address& owner, const Address& spender) const
{
    auto it = m_allowances.find({owner, spender});
    return it != m_allowances.end() ? it->second : 0;
}

bool InMemoryFungibleAsset::move_balance(const Address& from, const Address& to, Amount amount)
{
    if (amount <= 0 || to.empty())
    {
        return false;
    }
    auto it = m_balances.find(from);
    if (it == m_balances.end() || it->second < amount)
    {
        return false;
    }
    it->second -= amount;
    m_balances[to] += amount;
    return true;
}

// ============================================================================
// InMemoryCountedAsset
// ============================================================================

InMemoryCountedAsset::InMemoryCountedAsset(Address address)
    : m_address{std::move(address)}
{
}

Amount InMemoryCountedAsset::balance_of(const Address& holder, TokenId asset_id) const
{
    auto it = m_balances.find({holder, asset_id});
    return it != m_balances.end() ? it->second : 0;
}

void InMemoryCountedAsset::safe_transfer_from(const Address& operator_address,
                                              const Address& from,
                                              const Address& to,
                                              TokenId asset_id,
                                              Amount amount,
                                              const Bytes& data)
{
    if (amount <= 0)
    {
        throw CustodyError(m_address + ": transfer amount must be positive");
    }
    if (to.empty())
    {
        throw CustodyError(m_address + ": transfer to the empty address");
    }
    if (operator_address != from && !is_approved_for_all(from, operator_address))
    {
        throw CustodyError(m_address + ": " + operator_address +
                           " is not approved to move assets of " + from);
    }
    auto from_it = m_balances.find({from, asset_id});
    if (from_it == m_balances.end() || from_it->second < amount)
    {
        throw CustodyError(m_address + ": insufficient balance of asset " +
                           std::to_string(asset_id) + " held by " + from);
    }
    if (from != to && balance_of(to, asset_id) > std::numeric_limits<Amount>::max() - amount)
    {
        throw CustodyError(m_address + ": balance overflow of asset " +
                           std::to_string(asset_id) + " held by " + to);
    }

    from_it->second -= amount;
    m_balances[{to, asset_id}] += amount;

    auto revert = [&]() {
        m_balances[{to, asset_id}] -= amount;
        m_balances[{from, asset_id}] += amount;
    };

    IAssetReceiver* receiver = m_receivers.find(to);
    if (receiver == nullptr)
    {
        return;
    }
    std::uint32_t ack = 0;
    try
    {
        ack = receiver->on_counted_asset_received(operator_address, from, asset_id, amount, data);
    }
    catch (...)
    {
        revert();
        throw;
    }
    if (ack != kCountedAssetReceivedMagic)
    {
        revert();
        throw CustodyError(m_address + ": receiver " + to + " rejected asset " +
                           std::to_string(asset_id));
    }
}

void InMemoryCountedAsset::mint(const Address& to, TokenId asset_id, Amount amount)
{
    if (to.empty() || amount <= 0)
    {
        throw CustodyError(m_address + ": invalid mint");
    }
    if (balance_of(to, asset_id) > std::numeric_limits<Amount>::max() - amount)
    {
        throw CustodyError(m_address + ": balance overflow of asset " +
                           std::to_string(asset_id) + " held by " + to);
    }
    m_balances[{to, asset_id}] += amount;
}

void InMemoryCountedAsset::set_approval_for_all(const Address& owner,
                                                const Address& operator_address,
                                                bool approved)
{
    if (approved)
    {
        m_operator_approvals.emplace(owner, operator_address);
    }
    else
    {
        m_operator_approvals.erase({owner, operator_address});
    }
}

bool InMemoryCountedAsset::is_approved_for_all(const Address& owner,
                                               const Address& operator_address) const
{
    return m_operator_approvals.count({owner, operator_address}) != 0;
}

} // namespace composa
