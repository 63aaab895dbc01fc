/**
 * @file asset_interfaces.hpp
 * @brief Interfaces for external asset collaborators: INonFungibleAsset,
 *        IFungibleAsset, ICountedAsset, and the IAssetReceiver callbacks.
 */
#pragma once
#include "composa/common/common.hpp"
#include "composa/common/composition_types.hpp"

namespace composa
{

/**
 * @brief Acknowledgment a receiver must return to accept a non-fungible transfer.
 */
constexpr std::uint32_t kNonFungibleReceivedMagic = 0x150b7a02u;

/**
 * @brief Acknowledgment a receiver must return to accept a counted-asset transfer.
 */
constexpr std::uint32_t kCountedAssetReceivedMagic = 0xf23a6e61u;

/**
 * @brief Exception thrown by asset collaborators when a transfer is refused.
 */
class CustodyError : public std::runtime_error
{
public:
    explicit CustodyError(const std::string& msg)
        : std::runtime_error(msg)
    {
    }
};

/**
 * @brief Callbacks invoked by asset collaborators on an incoming transfer.
 *
 * @details
 * A collaborator that delivers custody to a registered receiver calls the
 * matching callback after the transfer. Any return value other than the
 * magic acknowledgment makes the collaborator revert the transfer.
 */
class IAssetReceiver
{
public:
    virtual ~IAssetReceiver() = 0;

    /**
     * @brief Accept or reject an incoming non-fungible token.
     * @return `kNonFungibleReceivedMagic` to accept; anything else rejects.
     */
    virtual std::uint32_t on_non_fungible_received(
        const Address& operator_address,
        const Address& from,
        TokenId token_id,
        const Bytes& data) = 0;

    /**
     * @brief Accept or reject incoming units of a counted asset.
     * @return `kCountedAssetReceivedMagic` to accept; anything else rejects.
     */
    virtual std::uint32_t on_counted_asset_received(
        const Address& operator_address,
        const Address& from,
        TokenId asset_id,
        Amount value,
        const Bytes& data) = 0;

protected:
    IAssetReceiver() = default;

private:
    IAssetReceiver(const IAssetReceiver&) = delete;
    IAssetReceiver(IAssetReceiver&&) = delete;
    IAssetReceiver& operator=(const IAssetReceiver&) = delete;
    IAssetReceiver& operator=(IAssetReceiver&&) = delete;
};

/**
 * @brief Interface for the non-fungible asset class whose tokens are nodes.
 *
 * @details
 * One instance represents one collection. The engine only needs the
 * ownership query (used for existence and for root ownership) and the
 * transfer primitive (used when a link or unlink moves custody).
 */
class INonFungibleAsset
{
public:
    virtual ~INonFungibleAsset() = 0;

    /**
     * @brief Address of this collection.
     */
    virtual const Address& address() const = 0;

    /**
     * @brief Current holder of a token.
     * @return The holder, or `std::nullopt` if the token does not exist.
     */
    virtual std::optional<Address> owner_of(TokenId token_id) const = 0;

    /**
     * @brief Move a token from `from` to `to`.
     * @throws CustodyError if the token is not held by `from`, the operator
     *         is not approved, or the receiver rejects it.
     */
    virtual void transfer_from(
        const Address& operator_address,
        const Address& from,
        const Address& to,
        TokenId token_id,
        const Bytes& data) = 0;

protected:
    INonFungibleAsset() = default;

private:
    INonFungibleAsset(const INonFungibleAsset&) = delete;
    INonFungibleAsset(INonFungibleAsset&&) = delete;
    INonFungibleAsset& operator=(const INonFungibleAsset&) = delete;
    INonFungibleAsset& operator=(INonFungibleAsset&&) = delete;
};

/**
 * @brief Interface for a currency-like fungible resource.
 *
 * @details
 * Transfers report failure through their return value, as the currency
 * standard does. Implementations may also throw `CustodyError`.
 */
class IFungibleAsset
{
public:
    virtual ~IFungibleAsset() = 0;

    virtual const Address& address() const = 0;

    virtual Amount balance_of(const Address& holder) const = 0;

    /**
     * @brief Move `amount` from `from` to `to`, with `from` acting directly.
     * @return True on success.
     */
    virtual bool transfer(const Address& from, const Address& to, Amount amount) = 0;

    /**
     * @brief Move `amount` from `from` to `to` using `spender`'s allowance.
     * @return True on success.
     */
    virtual bool transfer_from(
        const Address& spender,
        const Address& from,
        const Address& to,
        Amount amount) = 0;

protected:
    IFungibleAsset() = default;

private:
    IFungibleAsset(const IFungibleAsset&) = delete;
    IFungibleAsset(IFungibleAsset&&) = delete;
    IFungibleAsset& operator=(const IFungibleAsset&) = delete;
    IFungibleAsset& operator=(IFungibleAsset&&) = delete;
};

/**
 * @brief Interface for a multi-asset collection of counted units.
 */
class ICountedAsset
{
public:
    virtual ~ICountedAsset() = 0;

    virtual const Address& address() const = 0;

    virtual Amount balance_of(const Address& holder, TokenId asset_id) const = 0;

    /**
     * @brief Move `amount` units of `asset_id` from `from` to `to`.
     * @throws CustodyError if the balance or approval is insufficient, or the
     *         receiver rejects the transfer.
     */
    virtual void safe_transfer_from(
        const Address& operator_address,
        const Address& from,
        const Address& to,
        TokenId asset_id,
        Amount amount,
        const Bytes& data) = 0;

protected:
    ICountedAsset() = default;

private:
    ICountedAsset(const ICountedAsset&) = delete;
    ICountedAsset(ICountedAsset&&) = delete;
    ICountedAsset& operator=(const ICountedAsset&) = delete;
    ICountedAsset& operator=(ICountedAsset&&) = delete;
};

using NonFungibleAssetPtr = std::shared_ptr<INonFungibleAsset>;
using FungibleAssetPtr = std::shared_ptr<IFungibleAsset>;
using CountedAssetPtr = std::shared_ptr<ICountedAsset>;

inline IAssetReceiver::~IAssetReceiver() = default;
inline INonFungibleAsset::~INonFungibleAsset() = default;
inline IFungibleAsset::~IFungibleAsset() = default;
inline ICountedAsset::~ICountedAsset() = default;

} // namespace composa
