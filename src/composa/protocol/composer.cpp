/**
 * @file composer.cpp
 */
#include "composa/protocol/composer.hpp"

#include <spdlog/spdlog.h>

namespace composa
{

namespace
{

/// Run an operation body, logging a rejection before it propagates.
template <typename Func>
auto logged(const char* operation, Func&& body) -> decltype(body())
{
    try
    {
        return body();
    }
    catch (const CompositionError& e)
    {
        SPDLOG_WARN("{} rejected: {}: {}", operation, to_string(e.code()), e.what());
        throw;
    }
}

} // namespace

// ============================================================================
// Construction and wiring
// ============================================================================

Composer::Composer(ComposerConfig config)
    : m_config{std::move(config)}
    , m_registry{}
    , m_graph{m_config.graph}
    , m_ledger{}
    , m_policy{std::make_shared<AllowAllPolicy>()}
{
    if (m_config.custody_address.empty())
    {
        throw std::invalid_argument("Composer: custody address must not be empty");
    }
}

void Composer::register_collection(NonFungibleAssetPtr asset)
{
    m_registry.register_collection(std::move(asset));
}

void Composer::register_currency(FungibleAssetPtr asset)
{
    if (!asset || asset->address().empty())
    {
        throw std::invalid_argument("Composer::register_currency: null collaborator or empty address");
    }
    Address address = asset->address();
    m_currencies[address] = std::move(asset);
}

void Composer::register_counted_asset(CountedAssetPtr asset)
{
    if (!asset || asset->address().empty())
    {
        throw std::invalid_argument("Composer::register_counted_asset: null collaborator or empty address");
    }
    Address address = asset->address();
    m_counted_assets[address] = std::move(asset);
}

void Composer::set_authorization_policy(AuthorizationPolicyPtr policy)
{
    if (!policy)
    {
        throw std::invalid_argument("Composer::set_authorization_policy: null policy");
    }
    m_policy = std::move(policy);
}

void Composer::add_event_sink(EventSinkPtr sink)
{
    if (!sink)
    {
        throw std::invalid_argument("Composer::add_event_sink: null sink");
    }
    m_sinks.push_back(std::move(sink));
}

// ============================================================================
// Custody
// ============================================================================

template <typename Func>
void Composer::transfer_custody(const std::string& what, Func&& transfer)
{
    try
    {
        transfer();
    }
    catch (const CompositionError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw CompositionError(
            CompositionErrorCode::CustodyTransferFailed,
            "Failed to " + what + ": " + e.what());
    }
}

// ============================================================================
// NonFungible family
// ============================================================================

void Composer::link(const Address& actor,
                    const NodeId& source,
                    const NodeId& target,
                    const Bytes& annotation)
{
    logged("link", [&]() {
        require_exists(source);
        require_exists(target);
        NodeIdx sidx = participant(source);
        NodeIdx tidx = participant(target);
        m_graph.validate_link(sidx, tidx);
        authorize(OperationRequest{CompositionOperation::Link, ResourceKind::NonFungible,
                                   actor, source, target, std::nullopt});

        auto holder = m_registry.holder_of(source);
        if (holder && *holder != m_config.custody_address)
        {
            auto asset = require_collection(source.collection);
            transfer_custody("take custody of " + to_string(source), [&]() {
                ReceiptScope receipt(*this);
                asset->transfer_from(m_config.custody_address, *holder,
                                     m_config.custody_address, source.token_id, annotation);
            });
        }

        m_graph.link(sidx, tidx);
        SPDLOG_DEBUG("link {} -> {} by {}", to_string(source), to_string(target), actor);

        CompositionEvent event;
        event.operation = CompositionOperation::Link;
        event.kind = ResourceKind::NonFungible;
        event.actor = actor;
        event.source = source;
        event.target = target;
        event.annotation = annotation;
        emit(event);
    });
}

void Composer::update_target(const Address& actor,
                             const NodeId& source,
                             const NodeId& new_target,
                             const Bytes& annotation)
{
    logged("update_target", [&]() {
        require_exists(source);
        NodeIdx sidx = participant(source);
        if (!m_graph.get_target(sidx))
        {
            throw CompositionError(
                CompositionErrorCode::NotLinked,
                to_string(source) + " has no target; use link instead");
        }
        require_exists(new_target);
        NodeIdx tidx = participant(new_target);
        m_graph.validate_update_target(sidx, tidx);
        authorize(OperationRequest{CompositionOperation::UpdateTarget, ResourceKind::NonFungible,
                                   actor, source, new_target, std::nullopt});

        m_graph.update_target(sidx, tidx);
        SPDLOG_DEBUG("update_target {} -> {} by {}", to_string(source), to_string(new_target), actor);

        CompositionEvent event;
        event.operation = CompositionOperation::UpdateTarget;
        event.kind = ResourceKind::NonFungible;
        event.actor = actor;
        event.source = source;
        event.target = new_target;
        event.annotation = annotation;
        emit(event);
    });
}

void Composer::unlink(const Address& actor,
                      const Address& recipient,
                      const NodeId& source,
                      const Bytes& annotation)
{
    logged("unlink", [&]() {
        require_exists(source);
        NodeIdx sidx = participant(source);
        m_graph.validate_unlink(sidx);
        authorize(OperationRequest{CompositionOperation::Unlink, ResourceKind::NonFungible,
                                   actor, source, std::nullopt, std::nullopt});

        auto holder = m_registry.holder_of(source);
        if (holder && *holder == m_config.custody_address)
        {
            auto asset = require_collection(source.collection);
            transfer_custody("release custody of " + to_string(source), [&]() {
                asset->transfer_from(m_config.custody_address, m_config.custody_address,
                                     recipient, source.token_id, annotation);
            });
        }
        else
        {
            SPDLOG_WARN("unlink {}: custody is not held by {}; nothing to release",
                        to_string(source), m_config.custody_address);
        }

        m_graph.unlink(sidx);
        SPDLOG_DEBUG("unlink {} to {} by {}", to_string(source), recipient, actor);

        CompositionEvent event;
        event.operation = CompositionOperation::Unlink;
        event.kind = ResourceKind::NonFungible;
        event.actor = actor;
        event.source = source;
        event.recipient = recipient;
        event.annotation = annotation;
        emit(event);
    });
}

// ============================================================================
// Currency family
// ============================================================================

void Composer::link_fungible(const Address& actor,
                             const Address& currency,
                             Amount amount,
                             const NodeId& target,
                             const Bytes& annotation)
{
    logged("link_fungible", [&]() {
        link_attachment(actor, ResourceKey::currency(currency), amount, target, annotation);
    });
}

void Composer::update_fungible_target(const Address& actor,
                                      const Address& currency,
                                      const NodeId& from,
                                      const NodeId& to,
                                      const Bytes& annotation)
{
    logged("update_fungible_target", [&]() {
        update_attachment_target(actor, ResourceKey::currency(currency), from, to, annotation);
    });
}

Amount Composer::unlink_fungible(const Address& actor,
                                 const Address& recipient,
                                 const Address& currency,
                                 const NodeId& from,
                                 const Bytes& annotation)
{
    return logged("unlink_fungible", [&]() {
        return unlink_attachment(actor, recipient, ResourceKey::currency(currency), from, annotation);
    });
}

// ============================================================================
// CountedAsset family
// ============================================================================

void Composer::link_counted(const Address& actor,
                            const Address& collection,
                            TokenId asset_id,
                            Amount amount,
                            const NodeId& target,
                            const Bytes& annotation)
{
    logged("link_counted", [&]() {
        link_attachment(actor, ResourceKey::counted(collection, asset_id), amount, target, annotation);
    });
}

void Composer::update_counted_target(const Address& actor,
                                     const Address& collection,
                                     TokenId asset_id,
                                     const NodeId& from,
                                     const NodeId& to,
                                     const Bytes& annotation)
{
    logged("update_counted_target", [&]() {
        update_attachment_target(actor, ResourceKey::counted(collection, asset_id), from, to, annotation);
    });
}

Amount Composer::unlink_counted(const Address& actor,
                                const Address& recipient,
                                const Address& collection,
                                TokenId asset_id,
                                const NodeId& from,
                                const Bytes& annotation)
{
    return logged("unlink_counted", [&]() {
        return unlink_attachment(actor, recipient, ResourceKey::counted(collection, asset_id),
                                 from, annotation);
    });
}

// ============================================================================
// Attachment bodies
// ============================================================================

void Composer::link_attachment(const Address& actor,
                               const ResourceKey& key,
                               Amount amount,
                               const NodeId& target,
                               const Bytes& annotation)
{
    FungibleAssetPtr currency;
    CountedAssetPtr counted;
    if (key.kind == ResourceKind::Currency)
    {
        currency = require_currency(key.contract);
    }
    else
    {
        counted = require_counted_asset(key.contract);
    }
    require_exists(target);
    if (amount <= 0)
    {
        throw CompositionError(
            CompositionErrorCode::InvalidAmount,
            "Attachment amount " + std::to_string(amount) + " of " + to_string(key) +
                " must be positive");
    }
    NodeIdx tidx = participant(target);
    require_not_quarantined(tidx);
    if (m_ledger.balance_of(key, tidx) != 0)
    {
        throw CompositionError(
            CompositionErrorCode::AlreadyLinked,
            to_string(target) + " already holds an attachment of " + to_string(key) +
                "; use update or unlink instead");
    }
    m_ledger.validate_deposit(key, tidx, amount);
    if (actor == m_config.custody_address)
    {
        throw CompositionError(
            CompositionErrorCode::CustodyTransferFailed,
            "Custody cannot deposit " + to_string(key) + " from itself");
    }
    authorize(OperationRequest{CompositionOperation::Link, key.kind, actor, target, target, key});

    transfer_custody("deposit " + std::to_string(amount) + " of " + to_string(key), [&]() {
        Amount held_before = custody_balance(key);
        if (currency)
        {
            if (!currency->transfer_from(m_config.custody_address, actor,
                                         m_config.custody_address, amount))
            {
                throw CustodyError(key.contract + " reported a failed transfer from " + actor);
            }
        }
        else
        {
            ReceiptScope receipt(*this);
            counted->safe_transfer_from(m_config.custody_address, actor, m_config.custody_address,
                                        key.asset_id, amount, annotation);
        }
        Amount held_after = custody_balance(key);
        if (held_after - held_before != amount)
        {
            SPDLOG_ERROR("deposit of {} {} from {} changed custody by {}", amount, to_string(key),
                         actor, held_after - held_before);
            throw CustodyError(key.contract + " moved " + std::to_string(held_after - held_before) +
                               " into custody instead of " + std::to_string(amount));
        }
    });

    m_ledger.deposit(key, tidx, amount);
    SPDLOG_DEBUG("attach {} of {} to {} by {}", amount, to_string(key), to_string(target), actor);

    CompositionEvent event;
    event.operation = CompositionOperation::Link;
    event.kind = key.kind;
    event.actor = actor;
    event.resource = key;
    event.amount = amount;
    event.target = target;
    event.annotation = annotation;
    emit(event);
}

void Composer::update_attachment_target(const Address& actor,
                                        const ResourceKey& key,
                                        const NodeId& from,
                                        const NodeId& to,
                                        const Bytes& annotation)
{
    if (key.kind == ResourceKind::Currency)
    {
        require_currency(key.contract);
    }
    else
    {
        require_counted_asset(key.contract);
    }
    require_exists(from);
    require_exists(to);
    if (from == to)
    {
        throw CompositionError(
            CompositionErrorCode::SelfLink,
            "Cannot move the " + to_string(key) + " attachment of " + to_string(from) +
                " onto the same node");
    }
    NodeIdx fidx = participant(from);
    NodeIdx tidx = participant(to);
    require_not_quarantined(fidx);
    require_not_quarantined(tidx);
    if (m_ledger.balance_of(key, fidx) == 0)
    {
        throw CompositionError(
            CompositionErrorCode::NotLinked,
            to_string(from) + " holds no attachment of " + to_string(key));
    }
    if (m_ledger.balance_of(key, tidx) != 0)
    {
        throw CompositionError(
            CompositionErrorCode::AlreadyLinked,
            to_string(to) + " already holds an attachment of " + to_string(key));
    }
    authorize(OperationRequest{CompositionOperation::UpdateTarget, key.kind, actor, from, to, key});

    Amount moved = m_ledger.move_all(key, fidx, tidx);
    SPDLOG_DEBUG("move {} of {} from {} to {} by {}", moved, to_string(key), to_string(from),
                 to_string(to), actor);

    CompositionEvent event;
    event.operation = CompositionOperation::UpdateTarget;
    event.kind = key.kind;
    event.actor = actor;
    event.source = from;
    event.resource = key;
    event.amount = moved;
    event.target = to;
    event.annotation = annotation;
    emit(event);
}

Amount Composer::unlink_attachment(const Address& actor,
                                   const Address& recipient,
                                   const ResourceKey& key,
                                   const NodeId& from,
                                   const Bytes& annotation)
{
    FungibleAssetPtr currency;
    CountedAssetPtr counted;
    if (key.kind == ResourceKind::Currency)
    {
        currency = require_currency(key.contract);
    }
    else
    {
        counted = require_counted_asset(key.contract);
    }
    NodeIdx fidx = m_registry.find(from);
    Amount amount = fidx == NodeRegistry::npos ? 0 : m_ledger.balance_of(key, fidx);
    if (amount == 0)
    {
        throw CompositionError(
            CompositionErrorCode::NotLinked,
            to_string(from) + " holds no attachment of " + to_string(key));
    }
    require_not_quarantined(fidx);
    if (recipient == m_config.custody_address)
    {
        throw CompositionError(
            CompositionErrorCode::CustodyTransferFailed,
            "Custody cannot pay out " + to_string(key) + " to itself");
    }
    authorize(OperationRequest{CompositionOperation::Unlink, key.kind, actor, from, std::nullopt, key});

    transfer_custody("pay out " + std::to_string(amount) + " of " + to_string(key), [&]() {
        if (currency)
        {
            if (!currency->transfer(m_config.custody_address, recipient, amount))
            {
                throw CustodyError(key.contract + " reported a failed transfer to " + recipient);
            }
        }
        else
        {
            counted->safe_transfer_from(m_config.custody_address, m_config.custody_address,
                                        recipient, key.asset_id, amount, annotation);
        }
    });

    m_ledger.withdraw_all(key, fidx);
    SPDLOG_DEBUG("detach {} of {} from {} to {} by {}", amount, to_string(key), to_string(from),
                 recipient, actor);

    CompositionEvent event;
    event.operation = CompositionOperation::Unlink;
    event.kind = key.kind;
    event.actor = actor;
    event.source = from;
    event.resource = key;
    event.amount = amount;
    event.recipient = recipient;
    event.annotation = annotation;
    emit(event);
    return amount;
}

// ============================================================================
// Queries
// ============================================================================

NodeId Composer::find_root_token(const NodeId& node) const
{
    NodeIdx idx = m_registry.find(node);
    if (idx == NodeRegistry::npos)
    {
        return node;
    }
    return m_registry.at(m_graph.find_root(idx));
}

std::optional<NodeId> Composer::get_target(const NodeId& node) const
{
    NodeIdx idx = m_registry.find(node);
    if (idx == NodeRegistry::npos)
    {
        return std::nullopt;
    }
    auto target = m_graph.get_target(idx);
    if (!target)
    {
        return std::nullopt;
    }
    return m_registry.at(*target);
}

Amount Composer::balance_of_fungible(const NodeId& owner, const Address& currency) const
{
    NodeIdx idx = m_registry.find(owner);
    if (idx == NodeRegistry::npos)
    {
        return 0;
    }
    return m_ledger.balance_of(ResourceKey::currency(currency), idx);
}

Amount Composer::balance_of_counted(const NodeId& owner, const Address& collection, TokenId asset_id) const
{
    NodeIdx idx = m_registry.find(owner);
    if (idx == NodeRegistry::npos)
    {
        return 0;
    }
    return m_ledger.balance_of(ResourceKey::counted(collection, asset_id), idx);
}

std::optional<Address> Composer::owner_of(const NodeId& node) const
{
    return m_registry.holder_of(find_root_token(node));
}

std::optional<Address> Composer::holder_of(const NodeId& node) const
{
    return m_registry.holder_of(node);
}

std::vector<NodeId> Composer::children_of(const NodeId& node) const
{
    std::vector<NodeId> result;
    NodeIdx idx = m_registry.find(node);
    if (idx == NodeRegistry::npos)
    {
        return result;
    }
    for (NodeIdx child : m_graph.children(idx))
    {
        result.push_back(m_registry.at(child));
    }
    return result;
}

std::vector<std::pair<ResourceKey, Amount>> Composer::attachments_of(const NodeId& node) const
{
    NodeIdx idx = m_registry.find(node);
    if (idx == NodeRegistry::npos)
    {
        return {};
    }
    return m_ledger.attachments_of(idx);
}

bool Composer::is_quarantined(const NodeId& node) const noexcept
{
    NodeIdx idx = m_registry.find(node);
    return idx != NodeRegistry::npos && m_graph.is_quarantined(idx);
}

bool Composer::clear_quarantine(const NodeId& node)
{
    NodeIdx idx = m_registry.find(node);
    if (idx == NodeRegistry::npos || !m_graph.clear_quarantine(idx))
    {
        return false;
    }
    SPDLOG_INFO("Quarantine cleared for {}", to_string(node));
    return true;
}

// ============================================================================
// Diagnostics and export
// ============================================================================

std::shared_ptr<CompositionDiagnostics> Composer::get_diagnostics() const
{
    auto diagnostics = m_graph.get_diagnostics();

    for (const ResourceKey& key : m_ledger.resources())
    {
        Amount recorded = m_ledger.total_of(key);
        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Error;
        item.category = DiagnosticCategory::ConservationViolation;
        item.resource = key;
        try
        {
            Amount held = custody_balance(key);
            if (recorded <= held)
            {
                continue;
            }
            item.message = "Ledger records " + std::to_string(recorded) + " of " + to_string(key) +
                           " but custody holds " + std::to_string(held);
        }
        catch (const std::exception& e)
        {
            item.message = "Custody of " + to_string(key) + " cannot be verified: " + e.what();
        }
        m_ledger.enumerate([&](const ResourceKey& entry_key, NodeIdx owner, Amount) {
            if (entry_key == key)
            {
                item.involved_nodes.push_back(owner);
            }
        });
        diagnostics->add(std::move(item));
    }

    return diagnostics;
}

ExportedComposition Composer::export_state() const
{
    ExportedComposition state;
    auto exported = m_graph.export_graph();

    for (const auto& [source, target] : exported->edges)
    {
        state.edges.push_back(EdgeRecord{m_registry.at(source), m_registry.at(target)});
    }
    for (NodeIdx node = 0; node < exported->roots.size(); ++node)
    {
        if (exported->roots[node] != node || !m_graph.children(node).empty())
        {
            state.roots.push_back(RootRecord{m_registry.at(node), m_registry.at(exported->roots[node])});
        }
    }
    m_ledger.enumerate([&](const ResourceKey& key, NodeIdx owner, Amount amount) {
        state.attachments.push_back(AttachmentRecord{key, m_registry.at(owner), amount});
        state.totals[key] += amount;
    });
    return state;
}

// ============================================================================
// IAssetReceiver
// ============================================================================

std::uint32_t Composer::on_non_fungible_received(const Address& operator_address,
                                                 const Address& from,
                                                 TokenId token_id,
                                                 const Bytes&)
{
    if (m_pending_receipts > 0 || m_config.accept_unsolicited_transfers)
    {
        return kNonFungibleReceivedMagic;
    }
    SPDLOG_WARN("Rejected unsolicited token {} from {} (operator {})", token_id, from, operator_address);
    return 0;
}

std::uint32_t Composer::on_counted_asset_received(const Address& operator_address,
                                                  const Address& from,
                                                  TokenId asset_id,
                                                  Amount value,
                                                  const Bytes&)
{
    if (m_pending_receipts > 0 || m_config.accept_unsolicited_transfers)
    {
        return kCountedAssetReceivedMagic;
    }
    SPDLOG_WARN("Rejected unsolicited {} unit(s) of asset {} from {} (operator {})",
                value, asset_id, from, operator_address);
    return 0;
}

Composer::ReceiptScope::ReceiptScope(Composer& composer) noexcept
    : m_composer(composer)
{
    ++m_composer.m_pending_receipts;
}

Composer::ReceiptScope::~ReceiptScope()
{
    --m_composer.m_pending_receipts;
}

// ============================================================================
// Helpers
// ============================================================================

void Composer::require_exists(const NodeId& node) const
{
    if (!m_registry.exists(node))
    {
        throw CompositionError(
            CompositionErrorCode::NotFound,
            "Node " + to_string(node) + " does not exist");
    }
}

NodeIdx Composer::participant(const NodeId& node)
{
    NodeIdx idx = m_registry.intern(node);
    if (idx >= m_graph.node_count())
    {
        m_graph.add_node(idx);
    }
    return idx;
}

void Composer::require_not_quarantined(NodeIdx node) const
{
    if (m_graph.is_quarantined(node))
    {
        throw CompositionError(
            CompositionErrorCode::GraphCorrupted,
            "Node " + to_string(m_registry.at(node)) + " is quarantined");
    }
}

FungibleAssetPtr Composer::require_currency(const Address& currency) const
{
    auto it = m_currencies.find(currency);
    if (it == m_currencies.end())
    {
        throw CompositionError(
            CompositionErrorCode::NotFound,
            "Currency " + currency + " is not registered");
    }
    return it->second;
}

CountedAssetPtr Composer::require_counted_asset(const Address& collection) const
{
    auto it = m_counted_assets.find(collection);
    if (it == m_counted_assets.end())
    {
        throw CompositionError(
            CompositionErrorCode::NotFound,
            "Counted asset collection " + collection + " is not registered");
    }
    return it->second;
}

NonFungibleAssetPtr Composer::require_collection(const Address& collection) const
{
    auto asset = m_registry.collection(collection);
    if (!asset)
    {
        throw CompositionError(
            CompositionErrorCode::NotFound,
            "Collection " + collection + " is not registered");
    }
    return asset;
}

void Composer::authorize(const OperationRequest& request) const
{
    if (!m_policy->authorize(*this, request))
    {
        throw CompositionError(
            CompositionErrorCode::Unauthorized,
            request.actor + " is not authorized to " + to_string(request.operation) + " " +
                to_string(request.subject));
    }
}

Amount Composer::custody_balance(const ResourceKey& key) const
{
    if (key.kind == ResourceKind::Currency)
    {
        return require_currency(key.contract)->balance_of(m_config.custody_address);
    }
    return require_counted_asset(key.contract)->balance_of(m_config.custody_address, key.asset_id);
}

void Composer::emit(const CompositionEvent& event)
{
    // The operation has already committed; sink failures are only logged.
    for (const auto& sink : m_sinks)
    {
        try
        {
            sink->on_event(event);
        }
        catch (const std::exception& e)
        {
            SPDLOG_ERROR("Event sink failed on {} {}: {}", to_string(event.operation),
                         to_string(event.kind), e.what());
        }
    }
}

} // namespace composa
