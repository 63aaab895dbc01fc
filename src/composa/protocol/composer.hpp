/**
 * @file composer.hpp
 * @brief Composer orchestrates the link graph, the attachment ledger and custody.
 */
#pragma once
#include "composa/common/common.hpp"
#include "composa/common/composition_exceptions.hpp"
#include "composa/common/composition_types.hpp"
#include "composa/common/node_registry.hpp"
#include "composa/custody/asset_interfaces.hpp"
#include "composa/graph/exported_composition.hpp"
#include "composa/graph/link_graph.hpp"
#include "composa/graph/link_graph_diagnostics.hpp"
#include "composa/ledger/attachment_ledger.hpp"
#include "composa/protocol/authorization.hpp"
#include "composa/protocol/composition_event.hpp"

namespace composa
{

/**
 * @brief Configuration for Composer behavior.
 */
struct ComposerConfig
{
    /**
     * @brief Address under which the Composer holds custody of composed assets.
     * @details Also used as the operator address for every transfer it requests.
     */
    Address custody_address{"composa"};

    /**
     * @brief Root resolution bound and diagnostics threshold for the link graph.
     */
    LinkGraphConfig graph{};

    /**
     * @brief Whether receiver callbacks accept transfers the Composer did not request.
     * @details If false, unsolicited transfers are rejected so that custody
     *          never holds assets the ledger does not know about.
     */
    bool accept_unsolicited_transfers{false};
};

/**
 * @brief The composition protocol: validates, moves custody, commits, notifies.
 *
 * @details
 * `Composer` is the only writer of the link graph and the attachment ledger.
 * It bridges node identities to the index-based `LinkGraph` and
 * `AttachmentLedger` through its `NodeRegistry`, and it calls the asset
 * collaborators' transfer primitives when an operation moves custody.
 *
 * @par Operation sequence
 * 1. Validate existence, graph or ledger preconditions and quarantine.
 * 2. Ask the authorization policy.
 * 3. Move custody through the collaborator, if the operation does.
 * 4. Commit the graph or ledger mutation.
 * 5. Emit exactly one `CompositionEvent` to every sink.
 *
 * Every failure in steps 1 to 3 throws `CompositionError` with no change to
 * the graph, the ledger or custody. A collaborator that throws or reports
 * failure surfaces as `CustodyTransferFailed`.
 *
 * @par Participants
 * A node is interned and registered with the link graph the first time an
 * operation names it, after its existence has been checked. Interning is
 * identity bookkeeping only and is not rolled back when the operation later
 * fails.
 *
 * @par Custody
 * - NonFungible Link moves the node from its holder to `custody_address`;
 *   Unlink moves it from `custody_address` to the recipient.
 * - Currency and CountedAsset Link pull the amount from the actor into
 *   `custody_address` and credit the ledger only if the collaborator's
 *   custody balance grew by exactly that amount; Unlink pushes the recorded
 *   amount to the recipient. The custody address itself cannot deposit.
 * - UpdateTarget never moves custody.
 *
 * @par Queries
 * Queries never mutate and never consult collaborators, except `owner_of()`
 * and `holder_of()`. A node that has never been linked is its own root and
 * has no target.
 *
 * @par Thread safety
 * - No internal synchronization. Operations must be serialized by the host.
 */
class Composer : public IAssetReceiver
{
public:
    explicit Composer(ComposerConfig config = ComposerConfig{});
    ~Composer() override = default;

    const ComposerConfig& config() const noexcept
    {
        return m_config;
    }

    const Address& custody_address() const noexcept
    {
        return m_config.custody_address;
    }

    // -------------------------------------------------------------------------
    // Wiring
    // -------------------------------------------------------------------------

    void register_collection(NonFungibleAssetPtr asset);
    void register_currency(FungibleAssetPtr asset);
    void register_counted_asset(CountedAssetPtr asset);

    /**
     * @brief Replace the authorization policy.
     * @throw std::invalid_argument if `policy` is null.
     */
    void set_authorization_policy(AuthorizationPolicyPtr policy);

    /**
     * @throw std::invalid_argument if `sink` is null.
     */
    void add_event_sink(EventSinkPtr sink);

    // -------------------------------------------------------------------------
    // NonFungible family
    // -------------------------------------------------------------------------

    /**
     * @brief Link `source` under `target` and take custody of `source`.
     * @throw CompositionError with `NotFound`, `SelfLink`, `AlreadyLinked`,
     *        `CycleDetected`, `GraphCorrupted`, `Unauthorized` or
     *        `CustodyTransferFailed`.
     */
    void link(const Address& actor,
              const NodeId& source,
              const NodeId& target,
              const Bytes& annotation = {});

    /**
     * @brief Re-parent an already linked `source` under `new_target`.
     * @throw CompositionError with `NotFound`, `NotLinked`, `SelfLink`,
     *        `CycleDetected`, `GraphCorrupted` or `Unauthorized`.
     */
    void update_target(const Address& actor,
                       const NodeId& source,
                       const NodeId& new_target,
                       const Bytes& annotation = {});

    /**
     * @brief Remove the edge out of `source` and hand its custody to `recipient`.
     * @throw CompositionError with `NotFound`, `NotLinked`, `GraphCorrupted`,
     *        `Unauthorized` or `CustodyTransferFailed`.
     */
    void unlink(const Address& actor,
                const Address& recipient,
                const NodeId& source,
                const Bytes& annotation = {});

    // -------------------------------------------------------------------------
    // Currency family
    // -------------------------------------------------------------------------

    /**
     * @brief Pull `amount` of `currency` from the actor and attach it to `target`.
     * @throw CompositionError with `NotFound`, `InvalidAmount`, `AlreadyLinked`,
     *        `GraphCorrupted`, `Unauthorized` or `CustodyTransferFailed` (also
     *        when the actor is the custody address or custody did not grow by
     *        exactly `amount`).
     */
    void link_fungible(const Address& actor,
                       const Address& currency,
                       Amount amount,
                       const NodeId& target,
                       const Bytes& annotation = {});

    /**
     * @brief Move the whole `currency` attachment of `from` onto `to`.
     * @throw CompositionError with `NotFound`, `SelfLink`, `NotLinked`,
     *        `AlreadyLinked`, `GraphCorrupted` or `Unauthorized`.
     */
    void update_fungible_target(const Address& actor,
                                const Address& currency,
                                const NodeId& from,
                                const NodeId& to,
                                const Bytes& annotation = {});

    /**
     * @brief Detach the whole `currency` attachment of `from` and pay it to `recipient`.
     * @return The amount paid out.
     * @throw CompositionError with `NotFound`, `NotLinked`, `GraphCorrupted`,
     *        `Unauthorized` or `CustodyTransferFailed` (also when the recipient
     *        is the custody address).
     */
    Amount unlink_fungible(const Address& actor,
                           const Address& recipient,
                           const Address& currency,
                           const NodeId& from,
                           const Bytes& annotation = {});

    // -------------------------------------------------------------------------
    // CountedAsset family
    // -------------------------------------------------------------------------

    /**
     * @brief Pull `amount` units of (collection, asset_id) from the actor and attach them to `target`.
     * @throw As `link_fungible()`.
     */
    void link_counted(const Address& actor,
                      const Address& collection,
                      TokenId asset_id,
                      Amount amount,
                      const NodeId& target,
                      const Bytes& annotation = {});

    /**
     * @brief Move the whole (collection, asset_id) attachment of `from` onto `to`.
     * @throw As `update_fungible_target()`.
     */
    void update_counted_target(const Address& actor,
                               const Address& collection,
                               TokenId asset_id,
                               const NodeId& from,
                               const NodeId& to,
                               const Bytes& annotation = {});

    /**
     * @brief Detach the whole (collection, asset_id) attachment of `from` and send it to `recipient`.
     * @return The number of units sent.
     * @throw As `unlink_fungible()`.
     */
    Amount unlink_counted(const Address& actor,
                          const Address& recipient,
                          const Address& collection,
                          TokenId asset_id,
                          const NodeId& from,
                          const Bytes& annotation = {});

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    /**
     * @brief Resolve the root of a node.
     * @throw CompositionError with `GraphCorrupted` if the walk exceeds its bound.
     */
    NodeId find_root_token(const NodeId& node) const;

    std::optional<NodeId> get_target(const NodeId& node) const;

    Amount balance_of_fungible(const NodeId& owner, const Address& currency) const;

    Amount balance_of_counted(const NodeId& owner, const Address& collection, TokenId asset_id) const;

    /**
     * @brief The ultimate owner of a node: the holder of its resolved root.
     * @return The holder, or `std::nullopt` if the root does not exist.
     */
    std::optional<Address> owner_of(const NodeId& node) const;

    /**
     * @brief The direct holder of a node, as reported by its collection.
     */
    std::optional<Address> holder_of(const NodeId& node) const;

    /**
     * @brief Nodes currently linked directly under `node`.
     */
    std::vector<NodeId> children_of(const NodeId& node) const;

    /**
     * @brief Non-zero attachments held by `node`, ordered by resource key.
     */
    std::vector<std::pair<ResourceKey, Amount>> attachments_of(const NodeId& node) const;

    bool is_quarantined(const NodeId& node) const noexcept;

    /**
     * @brief Release a node from quarantine after manual investigation.
     * @return True if the node was quarantined.
     */
    bool clear_quarantine(const NodeId& node);

    /**
     * @brief Audit the forest invariants and ledger conservation against custody.
     */
    std::shared_ptr<CompositionDiagnostics> get_diagnostics() const;

    /**
     * @brief Snapshot the edges, roots of composed nodes, attachments and totals.
     * @details Roots are listed for every node that has a target or children.
     * @throw CompositionError with `GraphCorrupted` if a root cannot be resolved.
     */
    ExportedComposition export_state() const;

    const NodeRegistry& registry() const noexcept { return m_registry; }
    const LinkGraph& graph() const noexcept { return m_graph; }
    const AttachmentLedger& ledger() const noexcept { return m_ledger; }

    // -------------------------------------------------------------------------
    // IAssetReceiver
    // -------------------------------------------------------------------------

    std::uint32_t on_non_fungible_received(const Address& operator_address,
                                           const Address& from,
                                           TokenId token_id,
                                           const Bytes& data) override;

    std::uint32_t on_counted_asset_received(const Address& operator_address,
                                            const Address& from,
                                            TokenId asset_id,
                                            Amount value,
                                            const Bytes& data) override;

private:
    /// Marks the Composer as expecting incoming custody for its lifetime.
    class ReceiptScope
    {
    public:
        explicit ReceiptScope(Composer& composer) noexcept;
        ~ReceiptScope();

    private:
        Composer& m_composer;
    };

    ComposerConfig m_config;
    NodeRegistry m_registry;
    LinkGraph m_graph;
    AttachmentLedger m_ledger;
    std::unordered_map<Address, FungibleAssetPtr> m_currencies;
    std::unordered_map<Address, CountedAssetPtr> m_counted_assets;
    AuthorizationPolicyPtr m_policy;
    std::vector<EventSinkPtr> m_sinks;
    size_t m_pending_receipts = 0;

    // -------------------------------------------------------------------------
    // Helpers
    // -------------------------------------------------------------------------

    /// Throw NotFound unless the node currently exists.
    void require_exists(const NodeId& node) const;

    /// Intern an existing node and register it with the link graph.
    NodeIdx participant(const NodeId& node);

    /// Throw GraphCorrupted if the node is quarantined.
    void require_not_quarantined(NodeIdx node) const;

    FungibleAssetPtr require_currency(const Address& currency) const;
    CountedAssetPtr require_counted_asset(const Address& collection) const;
    NonFungibleAssetPtr require_collection(const Address& collection) const;

    void authorize(const OperationRequest& request) const;

    /// Run a collaborator transfer, mapping any failure to CustodyTransferFailed.
    template <typename Func>
    void transfer_custody(const std::string& what, Func&& transfer);

    /// Shared body of the Currency and CountedAsset families.
    void link_attachment(const Address& actor,
                         const ResourceKey& key,
                         Amount amount,
                         const NodeId& target,
                         const Bytes& annotation);
    void update_attachment_target(const Address& actor,
                                  const ResourceKey& key,
                                  const NodeId& from,
                                  const NodeId& to,
                                  const Bytes& annotation);
    Amount unlink_attachment(const Address& actor,
                             const Address& recipient,
                             const ResourceKey& key,
                             const NodeId& from,
                             const Bytes& annotation);

    /// Collaborator-reported custody balance of a resource.
    Amount custody_balance(const ResourceKey& key) const;

    void emit(const CompositionEvent& event);
};

} // namespace composa
