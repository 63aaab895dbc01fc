/**
 * @file attachment_ledger.hpp
 */
#pragma once
#include "composa/common/common.hpp"
#include "composa/common/composition_types.hpp"
#include "composa/common/composition_exceptions.hpp"

namespace composa
{

/**
 * @brief Bookkeeping of fungible and counted-asset attachments per node.
 *
 * @details
 * `AttachmentLedger` maps (resource key, owner node) to a positive quantity.
 * It is pure internal state: it never calls the asset collaborators. The
 * orchestration layer pairs every custody transfer with the matching ledger
 * mutation so that the two never diverge.
 *
 * @par Invariants
 * - Every stored balance is strictly positive; zero entries are erased.
 * - `total_of(key)` equals the sum of `balance_of(key, n)` over all nodes.
 * - `move_all()` leaves every total unchanged.
 *
 * @par Exception safety
 * Every mutating method either succeeds or throws with the ledger unchanged.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads (const methods) are safe if no concurrent writes occur.
 */
class AttachmentLedger
{
public:
    /**
     * @brief Check every precondition of `deposit()` without mutating.
     * @throw As `deposit()` would.
     */
    void validate_deposit(const ResourceKey& key, NodeIdx owner, Amount amount) const;

    /**
     * @brief Increment the balance of (key, owner) by `amount`.
     * @throw CompositionError with `InvalidAmount` if `amount <= 0` or the
     *        balance or total would overflow.
     * @throw std::invalid_argument if `key.kind` is `NonFungible`.
     */
    void deposit(const ResourceKey& key, NodeIdx owner, Amount amount);

    /**
     * @brief Remove part of the balance of (key, owner).
     * @return The remaining balance.
     * @throw CompositionError with `InvalidAmount` if `amount <= 0` or it
     *        exceeds the balance, or `NotFound` if the balance is zero.
     */
    Amount withdraw(const ResourceKey& key, NodeIdx owner, Amount amount);

    /**
     * @brief Zero the balance of (key, owner) and return what it was.
     * @throw CompositionError with `NotFound` if the balance is zero.
     */
    Amount withdraw_all(const ResourceKey& key, NodeIdx owner);

    /**
     * @brief Move the whole balance of (key, from) onto (key, to).
     * @return The amount moved.
     * @throw CompositionError with `NotFound` if the balance of `from` is
     *        zero, `SelfLink` if from == to, or `InvalidAmount` if the
     *        destination balance would overflow.
     */
    Amount move_all(const ResourceKey& key, NodeIdx from, NodeIdx to);

    /**
     * @brief Current balance of (key, owner); 0 when absent.
     */
    Amount balance_of(const ResourceKey& key, NodeIdx owner) const noexcept;

    /**
     * @brief Sum of all balances recorded for `key`.
     */
    Amount total_of(const ResourceKey& key) const noexcept;

    /**
     * @brief All non-zero attachments held by `owner`, ordered by resource key.
     */
    std::vector<std::pair<ResourceKey, Amount>> attachments_of(NodeIdx owner) const;

    /**
     * @brief Resource keys with a non-zero total, in key order.
     */
    std::vector<ResourceKey> resources() const;

    /**
     * @brief Number of non-zero (key, owner) entries.
     */
    size_t entry_count() const noexcept
    {
        return m_entry_count;
    }

    /**
     * @brief Enumerate every non-zero entry, ordered by key then owner.
     * @tparam Func A callable type with signature
     *         `void(const ResourceKey&, NodeIdx, Amount)`.
     * @warning Do not modify the ledger from inside the callback.
     */
    template <typename Func>
    void enumerate(Func&& func) const
    {
        static_assert(std::is_invocable_v<Func&, const ResourceKey&, NodeIdx, Amount>,
            "Func must be callable as f(const ResourceKey&, NodeIdx, Amount)");
        for (const auto& [key, owners] : m_balances)
        {
            for (const auto& [owner, amount] : owners)
            {
                func(key, owner, amount);
            }
        }
    }

private:
    /// Balances per resource key, then per owner node. No zero entries.
    std::map<ResourceKey, std::map<NodeIdx, Amount>> m_balances;

    /// Sum of balances per resource key. No zero entries.
    std::map<ResourceKey, Amount> m_totals;

    size_t m_entry_count = 0;

    /// Throw NotFound unless (key, owner) has a positive balance.
    Amount require_balance(const ResourceKey& key, NodeIdx owner) const;

    /// Lower (key, owner) by amount, which must not exceed the balance.
    void debit(const ResourceKey& key, NodeIdx owner, Amount amount);
};

} // namespace composa
