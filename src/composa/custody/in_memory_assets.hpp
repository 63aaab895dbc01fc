/**
 * @file in_memory_assets.hpp
 * @brief In-memory reference implementations of the asset collaborators.
 */
#pragma once
#include "composa/common/common.hpp"
#include "composa/custody/asset_interfaces.hpp"

namespace composa
{

/**
 * @brief Registry of receivers shared by the in-memory collaborators.
 *
 * @details
 * Receivers are held as raw, non-owning pointers. The caller must
 * unregister a receiver (or destroy the collaborator) before the receiver
 * is destroyed.
 */
class ReceiverDirectory
{
public:
    void register_receiver(const Address& address, IAssetReceiver* receiver);
    void unregister_receiver(const Address& address);

    /**
     * @return The receiver registered at `address`, or nullptr.
     */
    IAssetReceiver* find(const Address& address) const noexcept;

private:
    std::unordered_map<Address, IAssetReceiver*> m_receivers;
};

/**
 * @brief In-memory non-fungible collection.
 *
 * @par Transfer rules
 * - The token must exist and be held by `from`.
 * - The operator must be `from` or approved for all of `from`'s tokens.
 * - If `to` is a registered receiver, it must acknowledge with
 *   `kNonFungibleReceivedMagic`; otherwise the transfer is reverted.
 */
class InMemoryNonFungibleAsset : public INonFungibleAsset
{
public:
    explicit InMemoryNonFungibleAsset(Address address);

    const Address& address() const override { return m_address; }
    std::optional<Address> owner_of(TokenId token_id) const override;
    void transfer_from(const Address& operator_address,
                       const Address& from,
                       const Address& to,
                       TokenId token_id,
                       const Bytes& data) override;

    /**
     * @throws CustodyError if the token already exists or `to` is empty.
     */
    void mint(const Address& to, TokenId token_id);

    /**
     * @throws CustodyError if the token does not exist.
     */
    void burn(TokenId token_id);

    void set_approval_for_all(const Address& owner, const Address& operator_address, bool approved);
    bool is_approved_for_all(const Address& owner, const Address& operator_address) const;

    ReceiverDirectory& receivers() noexcept { return m_receivers; }

private:
    Address m_address;
    std::unordered_map<TokenId, Address> m_owners;
    std::set<std::pair<Address, Address>> m_operator_approvals;
    ReceiverDirectory m_receivers;
};

/**
 * @brief In-memory currency.
 *
 * @details
 * `transfer()` and `transfer_from()` return false instead of throwing when
 * the balance or allowance is insufficient or the amount is not positive.
 */
class InMemoryFungibleAsset : public IFungibleAsset
{
public:
    explicit InMemoryFungibleAsset(Address address);

    const Address& address() const override { return m_address; }
    Amount balance_of(const Address& holder) const override;
    bool transfer(const Address& from, const Address& to, Amount amount) override;
    bool transfer_from(const Address& spender,
                       const Address& from,
                       const Address& to,
                       Amount amount) override;

    /**
     * @throws CustodyError if `amount` is not positive or would overflow.
     */
    void mint(const Address& to, Amount amount);

    void approve(const Address& owner, const Address& spender, Amount amount);
    Amount allowance(const Address& owner, const Address& spender) const;
    Amount total_supply() const noexcept { return m_total_supply; }

private:
    bool move_balance(const Address& from, const Address& to, Amount amount);

    Address m_address;
    std::unordered_map<Address, Amount> m_balances;
    std::map<std::pair<Address, Address>, Amount> m_allowances;
    Amount m_total_supply{0};
};

/**
 * @brief In-memory multi-asset collection of counted units.
 *
 * @par Transfer rules
 * - `amount` must be positive and not exceed `from`'s balance of `asset_id`.
 * - The operator must be `from` or approved for all of `from`'s assets.
 * - If `to` is a registered receiver, it must acknowledge with
 *   `kCountedAssetReceivedMagic`; otherwise the transfer is reverted.
 */
class InMemoryCountedAsset : public ICountedAsset
{
public:
    explicit InMemoryCountedAsset(Address address);

    const Address& address() const override { return m_address; }
    Amount balance_of(const Address& holder, TokenId asset_id) const override;
    void safe_transfer_from(const Address& operator_address,
                            const Address& from,
                            const Address& to,
                            TokenId asset_id,
                            Amount amount,
                            const Bytes& data) override;

    void mint(const Address& to, TokenId asset_id, Amount amount);
    void set_approval_for_all(const Address& owner, const Address& operator_address, bool approved);
    bool is_approved_for_all(const Address& owner, const Address& operator_address) const;

    ReceiverDirectory& receivers() noexcept { return m_receivers; }

private:
    Address m_address;
    std::map<std::pair<Address, TokenId>, Amount> m_balances;
    std::set<std::pair<Address, Address>> m_operator_approvals;
    ReceiverDirectory m_receivers;
};

} // namespace composa
