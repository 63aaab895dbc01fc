/**
 * @file attachment_ledger.cpp
 */
#include "composa/ledger/attachment_ledger.hpp"

namespace composa
{

namespace
{

constexpr Amount kMaxAmount = std::numeric_limits<Amount>::max();

std::string describe(const ResourceKey& key, NodeIdx owner)
{
    return to_string(key) + " on node " + std::to_string(owner);
}

} // namespace

// ============================================================================
// Deposit
// ============================================================================

void AttachmentLedger::validate_deposit(const ResourceKey& key, NodeIdx owner, Amount amount) const
{
    if (key.kind == ResourceKind::NonFungible)
    {
        throw std::invalid_argument("AttachmentLedger: non-fungible resources are not attachments");
    }
    if (amount <= 0)
    {
        throw CompositionError(
            CompositionErrorCode::InvalidAmount,
            "Deposit amount " + std::to_string(amount) + " for " + describe(key, owner) +
                " must be positive");
    }
    if (total_of(key) > kMaxAmount - amount)
    {
        throw CompositionError(
            CompositionErrorCode::InvalidAmount,
            "Deposit of " + std::to_string(amount) + " would overflow the total of " +
                to_string(key));
    }
}

void AttachmentLedger::deposit(const ResourceKey& key, NodeIdx owner, Amount amount)
{
    validate_deposit(key, owner, amount);

    // The total bounds every balance, so checking it covers both.
    auto& owners = m_balances[key];
    auto [it, inserted] = owners.emplace(owner, 0);
    it->second += amount;
    m_totals[key] += amount;
    if (inserted)
    {
        ++m_entry_count;
    }
}

// ============================================================================
// Withdraw
// ============================================================================

Amount AttachmentLedger::withdraw(const ResourceKey& key, NodeIdx owner, Amount amount)
{
    if (amount <= 0)
    {
        throw CompositionError(
            CompositionErrorCode::InvalidAmount,
            "Withdraw amount " + std::to_string(amount) + " for " + describe(key, owner) +
                " must be positive");
    }
    Amount balance = require_balance(key, owner);
    if (amount > balance)
    {
        throw CompositionError(
            CompositionErrorCode::InvalidAmount,
            "Withdraw of " + std::to_string(amount) + " exceeds the balance " +
                std::to_string(balance) + " of " + describe(key, owner));
    }
    debit(key, owner, amount);
    return balance - amount;
}

Amount AttachmentLedger::withdraw_all(const ResourceKey& key, NodeIdx owner)
{
    Amount balance = require_balance(key, owner);
    debit(key, owner, balance);
    return balance;
}

// ============================================================================
// Move
// ============================================================================

Amount AttachmentLedger::move_all(const ResourceKey& key, NodeIdx from, NodeIdx to)
{
    if (from == to)
    {
        throw CompositionError(
            CompositionErrorCode::SelfLink,
            "Cannot move " + describe(key, from) + " onto the same node");
    }
    Amount balance = require_balance(key, from);
    if (balance_of(key, to) > kMaxAmount - balance)
    {
        throw CompositionError(
            CompositionErrorCode::InvalidAmount,
            "Moving " + describe(key, from) + " to node " + std::to_string(to) +
                " would overflow its balance");
    }

    auto& owners = m_balances.at(key);
    auto [it, inserted] = owners.emplace(to, 0);
    it->second += balance;
    if (inserted)
    {
        ++m_entry_count;
    }
    owners.erase(from);
    --m_entry_count;
    return balance;
}

// ============================================================================
// Queries
// ============================================================================

Amount AttachmentLedger::balance_of(const ResourceKey& key, NodeIdx owner) const noexcept
{
    auto key_it = m_balances.find(key);
    if (key_it == m_balances.end())
    {
        return 0;
    }
    auto owner_it = key_it->second.find(owner);
    return owner_it != key_it->second.end() ? owner_it->second : 0;
}

Amount AttachmentLedger::total_of(const ResourceKey& key) const noexcept
{
    auto it = m_totals.find(key);
    return it != m_totals.end() ? it->second : 0;
}

std::vector<std::pair<ResourceKey, Amount>> AttachmentLedger::attachments_of(NodeIdx owner) const
{
    std::vector<std::pair<ResourceKey, Amount>> result;
    for (const auto& [key, owners] : m_balances)
    {
        auto it = owners.find(owner);
        if (it != owners.end())
        {
            result.emplace_back(key, it->second);
        }
    }
    return result;
}

std::vector<ResourceKey> AttachmentLedger::resources() const
{
    std::vector<ResourceKey> result;
    result.reserve(m_totals.size());
    for (const auto& entry : m_totals)
    {
        result.push_back(entry.first);
    }
    return result;
}

// ============================================================================
// Helpers
// ============================================================================

Amount AttachmentLedger::require_balance(const ResourceKey& key, NodeIdx owner) const
{
    Amount balance = balance_of(key, owner);
    if (balance == 0)
    {
        throw CompositionError(
            CompositionErrorCode::NotFound,
            "No attachment of " + describe(key, owner));
    }
    return balance;
}

void AttachmentLedger::debit(const ResourceKey& key, NodeIdx owner, Amount amount)
{
    auto key_it = m_balances.find(key);
    auto owner_it = key_it->second.find(owner);
    owner_it->second -= amount;
    if (owner_it->second == 0)
    {
        key_it->second.erase(owner_it);
        --m_entry_count;
        if (key_it->second.empty())
        {
            m_balances.erase(key_it);
        }
    }

    auto total_it = m_totals.find(key);
    total_it->second -= amount;
    if (total_it->second == 0)
    {
        m_totals.erase(total_it);
    }
}

} // namespace composa
