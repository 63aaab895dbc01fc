/**
 * @file authorization.hpp
 * @brief Pluggable authorization policies for composition operations.
 */
#pragma once
#include "composa/common/common.hpp"
#include "composa/common/composition_types.hpp"
#include "composa/protocol/composition_event.hpp"

namespace composa
{

class Composer;

/**
 * @brief What an actor is asking to do, as seen by an authorization policy.
 *
 * @details
 * `subject` is the node whose edge or attachment is affected:
 * - NonFungible: the node being linked, retargeted or unlinked.
 * - Currency / CountedAsset Link: the receiving node.
 * - Currency / CountedAsset UpdateTarget and Unlink: the node the attachment leaves.
 */
struct OperationRequest
{
    CompositionOperation operation{CompositionOperation::Link};
    ResourceKind kind{ResourceKind::NonFungible};
    Address actor;
    NodeId subject;
    std::optional<NodeId> target;
    std::optional<ResourceKey> resource;
};

/**
 * @brief Interface for deciding whether an actor may perform an operation.
 *
 * @details
 * Called by the Composer after every other precondition has passed and
 * before any custody moves. Returning false makes the operation fail with
 * `Unauthorized`.
 */
class IAuthorizationPolicy
{
public:
    virtual ~IAuthorizationPolicy() = default;

    virtual bool authorize(const Composer& composer, const OperationRequest& request) const = 0;
};

using AuthorizationPolicyPtr = std::shared_ptr<IAuthorizationPolicy>;

/**
 * @brief Policy that authorizes everything. The Composer's default.
 */
class AllowAllPolicy : public IAuthorizationPolicy
{
public:
    bool authorize(const Composer& composer, const OperationRequest& request) const override;
};

/**
 * @brief Policy that ties authority to ownership of the affected tree.
 *
 * @par Rules
 * - NonFungible Link: the actor must hold the node being linked.
 * - Every UpdateTarget and Unlink: the actor must hold the resolved root of
 *   the subject node.
 * - Currency / CountedAsset Link: always allowed; the custody transfer from
 *   the actor is the authorization.
 */
class RootOwnerPolicy : public IAuthorizationPolicy
{
public:
    bool authorize(const Composer& composer, const OperationRequest& request) const override;
};

} // namespace composa
