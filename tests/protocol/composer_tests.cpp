/**
 * @file composer_tests.cpp
 * Unit tests for the NonFungible family of the Composer, its queries,
 * events, quarantine handling and receiver callbacks.
 */
#include "composer_test_fixture.hpp"

using namespace composa;
using namespace composa_test;

namespace
{

ComposerConfig shallow_config()
{
    ComposerConfig config;
    config.graph.max_depth = 2;
    return config;
}

/**
 * @brief Collection whose transfers always fail.
 */
class BrokenCollection : public INonFungibleAsset
{
public:
    explicit BrokenCollection(Address address)
        : m_address{std::move(address)}
    {}

    const Address& address() const override { return m_address; }

    std::optional<Address> owner_of(TokenId) const override
    {
        return Address{"alice"};
    }

    void transfer_from(const Address&, const Address&, const Address&, TokenId, const Bytes&) override
    {
        ++attempts;
        throw CustodyError(m_address + ": transfers are disabled");
    }

    int attempts{0};

private:
    Address m_address;
};

/**
 * @brief Event sink that always throws.
 */
class ThrowingSink : public IEventSink
{
public:
    void on_event(const CompositionEvent&) override
    {
        ++calls;
        throw std::runtime_error("sink is down");
    }

    int calls{0};
};

} // namespace

class ComposerTests : public ComposerFixture
{
};

class ShallowComposerTests : public ComposerFixture
{
protected:
    ShallowComposerTests()
        : ComposerFixture(shallow_config())
    {}
};

// ============================================================================
// Scenarios
// ============================================================================

TEST_F(ComposerTests, Link_RootOfSourceIsTarget)
{
    composer.link(kAlice, node(1), node(2));

    EXPECT_EQ(composer.find_root_token(node(1)), node(2));
    EXPECT_EQ(composer.find_root_token(node(2)), node(2));
    EXPECT_EQ(composer.get_target(node(1)), std::optional<NodeId>(node(2)));
    EXPECT_EQ(items->owner_of(1), std::optional<Address>(composer.custody_address()));
    EXPECT_EQ(composer.owner_of(node(1)), std::optional<Address>(kAlice));
}

TEST_F(ComposerTests, Link_CycleIsRejectedWithStateUnchanged)
{
    composer.link(kAlice, node(1), node(2));
    auto before = composer.export_state();

    EXPECT_EQ(code_of([&]() { composer.link(kAlice, node(2), node(1)); }),
              CompositionErrorCode::CycleDetected);

    auto after = composer.export_state();
    ASSERT_EQ(after.edges.size(), before.edges.size());
    EXPECT_EQ(after.edges[0].source, node(1));
    EXPECT_EQ(after.edges[0].target, node(2));
    EXPECT_EQ(items->owner_of(2), std::optional<Address>(kAlice));
    EXPECT_EQ(events->size(), 1u);
}

TEST_F(ComposerTests, Link_SecondTargetThenUpdateTarget)
{
    composer.link(kAlice, node(1), node(2));
    EXPECT_EQ(code_of([&]() { composer.link(kAlice, node(1), node(3)); }),
              CompositionErrorCode::AlreadyLinked);

    composer.update_target(kAlice, node(1), node(3));
    EXPECT_EQ(composer.get_target(node(1)), std::optional<NodeId>(node(3)));
    EXPECT_TRUE(composer.children_of(node(2)).empty());
    EXPECT_EQ(composer.children_of(node(3)), (std::vector<NodeId>{node(1)}));
}

TEST_F(ComposerTests, Unlink_WithoutTargetIsNotLinked)
{
    EXPECT_EQ(code_of([&]() { composer.unlink(kAlice, kAlice, node(1)); }),
              CompositionErrorCode::NotLinked);
    EXPECT_TRUE(events->events().empty());
}

// ============================================================================
// NonFungible family
// ============================================================================

TEST_F(ComposerTests, Link_SelfIsSelfLink)
{
    EXPECT_EQ(code_of([&]() { composer.link(kAlice, node(1), node(1)); }),
              CompositionErrorCode::SelfLink);
    EXPECT_EQ(items->owner_of(1), std::optional<Address>(kAlice));
}

TEST_F(ComposerTests, Link_MissingNodeIsNotFound)
{
    EXPECT_EQ(code_of([&]() { composer.link(kAlice, node(99), node(1)); }),
              CompositionErrorCode::NotFound);
    EXPECT_EQ(code_of([&]() { composer.link(kAlice, node(1), node(99)); }),
              CompositionErrorCode::NotFound);
    EXPECT_EQ(code_of([&]() { composer.link(kAlice, NodeId{"unknown", 1}, node(1)); }),
              CompositionErrorCode::NotFound);
    EXPECT_EQ(items->owner_of(1), std::optional<Address>(kAlice));
}

TEST_F(ComposerTests, Link_CrossOwnerTargetIsAllowed)
{
    composer.link(kAlice, node(1), node(7));
    EXPECT_EQ(composer.owner_of(node(1)), std::optional<Address>(kBob));
}

TEST_F(ComposerTests, Link_DeepTreeResolvesRootFromEveryNode)
{
    composer.link(kAlice, node(1), node(2));
    composer.link(kAlice, node(2), node(3));
    composer.link(kAlice, node(4), node(3));
    composer.link(kAlice, node(3), node(5));

    for (TokenId id : {1u, 2u, 3u, 4u, 5u})
    {
        EXPECT_EQ(composer.find_root_token(node(id)), node(5));
    }
    EXPECT_EQ(composer.find_root_token(node(6)), node(6));
}

TEST_F(ComposerTests, UpdateTarget_IntoDescendantIsCycle)
{
    composer.link(kAlice, node(2), node(1));
    composer.link(kAlice, node(3), node(2));
    composer.link(kAlice, node(1), node(4));

    EXPECT_EQ(code_of([&]() { composer.update_target(kAlice, node(1), node(3)); }),
              CompositionErrorCode::CycleDetected);
    EXPECT_EQ(composer.get_target(node(1)), std::optional<NodeId>(node(4)));
}

TEST_F(ComposerTests, UpdateTarget_UnlinkedSourceIsNotLinked)
{
    EXPECT_EQ(code_of([&]() { composer.update_target(kAlice, node(1), node(2)); }),
              CompositionErrorCode::NotLinked);
}

TEST_F(ComposerTests, UpdateTarget_UnlinkedSourceIsNotLinkedBeforeTargetLookup)
{
    items->burn(3);
    EXPECT_EQ(code_of([&]() { composer.update_target(kAlice, node(1), node(3)); }),
              CompositionErrorCode::NotLinked);

    composer.link(kAlice, node(1), node(2));
    EXPECT_EQ(code_of([&]() { composer.update_target(kAlice, node(1), node(3)); }),
              CompositionErrorCode::NotFound);
    EXPECT_EQ(composer.get_target(node(1)), std::optional<NodeId>(node(2)));
}

TEST_F(ComposerTests, UpdateTarget_DoesNotMoveCustody)
{
    composer.link(kAlice, node(1), node(2));
    composer.update_target(kAlice, node(1), node(3));
    EXPECT_EQ(items->owner_of(1), std::optional<Address>(composer.custody_address()));
    EXPECT_EQ(items->owner_of(3), std::optional<Address>(kAlice));
}

TEST_F(ComposerTests, Unlink_ReleasesCustodyToRecipient)
{
    composer.link(kAlice, node(1), node(2));
    composer.unlink(kAlice, kBob, node(1));

    EXPECT_FALSE(composer.get_target(node(1)).has_value());
    EXPECT_EQ(composer.find_root_token(node(1)), node(1));
    EXPECT_EQ(items->owner_of(1), std::optional<Address>(kBob));
    EXPECT_TRUE(composer.children_of(node(2)).empty());
}

TEST_F(ComposerTests, Unlink_KeepsSubtreeUnderSource)
{
    composer.link(kAlice, node(1), node(2));
    composer.link(kAlice, node(2), node(3));
    composer.unlink(kAlice, kAlice, node(2));

    EXPECT_EQ(composer.find_root_token(node(1)), node(2));
    EXPECT_EQ(items->owner_of(1), std::optional<Address>(composer.custody_address()));
    EXPECT_EQ(composer.owner_of(node(1)), std::optional<Address>(kAlice));
}

TEST_F(ComposerTests, Relink_AfterUnlink)
{
    composer.link(kAlice, node(1), node(2));
    composer.unlink(kAlice, kAlice, node(1));
    composer.link(kAlice, node(1), node(3));
    EXPECT_EQ(composer.find_root_token(node(1)), node(3));
}

// ============================================================================
// Atomicity on custody failure
// ============================================================================

TEST_F(ComposerTests, Link_CustodyFailureLeavesNoEdge)
{
    items->set_approval_for_all(kAlice, composer.custody_address(), false);

    EXPECT_EQ(code_of([&]() { composer.link(kAlice, node(1), node(2)); }),
              CompositionErrorCode::CustodyTransferFailed);
    EXPECT_FALSE(composer.get_target(node(1)).has_value());
    EXPECT_EQ(items->owner_of(1), std::optional<Address>(kAlice));
    EXPECT_TRUE(events->events().empty());
}

TEST_F(ComposerTests, Link_ThrowingCollaboratorLeavesNoEdge)
{
    auto broken = std::make_shared<BrokenCollection>("broken");
    composer.register_collection(broken);
    NodeId source{"broken", 1};

    EXPECT_EQ(code_of([&]() { composer.link(kAlice, source, node(1)); }),
              CompositionErrorCode::CustodyTransferFailed);
    EXPECT_EQ(broken->attempts, 1);
    EXPECT_FALSE(composer.get_target(source).has_value());
    EXPECT_TRUE(composer.get_diagnostics()->is_valid());
}

TEST_F(ComposerTests, Unlink_CustodyFailureKeepsEdge)
{
    composer.link(kAlice, node(1), node(2));

    EXPECT_EQ(code_of([&]() { composer.unlink(kAlice, "", node(1)); }),
              CompositionErrorCode::CustodyTransferFailed);
    EXPECT_EQ(composer.get_target(node(1)), std::optional<NodeId>(node(2)));
    EXPECT_EQ(items->owner_of(1), std::optional<Address>(composer.custody_address()));
}

// ============================================================================
// Events
// ============================================================================

TEST_F(ComposerTests, Events_OnePerSuccessfulOperation)
{
    Bytes annotation{0xde, 0xad};
    composer.link(kAlice, node(1), node(2), annotation);
    composer.update_target(kAlice, node(1), node(3));
    composer.unlink(kAlice, kBob, node(1));

    const auto& log = events->events();
    ASSERT_EQ(log.size(), 3u);

    EXPECT_EQ(log[0].operation, CompositionOperation::Link);
    EXPECT_EQ(log[0].kind, ResourceKind::NonFungible);
    EXPECT_EQ(log[0].actor, kAlice);
    EXPECT_EQ(log[0].source, std::optional<NodeId>(node(1)));
    EXPECT_EQ(log[0].target, std::optional<NodeId>(node(2)));
    EXPECT_EQ(log[0].annotation, annotation);
    EXPECT_EQ(log[0].amount, 0);

    EXPECT_EQ(log[1].operation, CompositionOperation::UpdateTarget);
    EXPECT_EQ(log[1].target, std::optional<NodeId>(node(3)));

    EXPECT_EQ(log[2].operation, CompositionOperation::Unlink);
    EXPECT_EQ(log[2].recipient, std::optional<Address>(kBob));
    EXPECT_FALSE(log[2].target.has_value());
}

TEST_F(ComposerTests, Events_NoneOnFailure)
{
    EXPECT_THROW(composer.link(kAlice, node(1), node(1)), CompositionError);
    EXPECT_THROW(composer.unlink(kAlice, kAlice, node(1)), CompositionError);
    EXPECT_THROW(composer.update_target(kAlice, node(1), node(2)), CompositionError);
    EXPECT_TRUE(events->events().empty());
}

TEST_F(ComposerTests, Events_ThrowingSinkDoesNotFailCommittedOperation)
{
    auto throwing = std::make_shared<ThrowingSink>();
    auto later = std::make_shared<EventLog>();
    composer.add_event_sink(throwing);
    composer.add_event_sink(later);

    EXPECT_NO_THROW(composer.link(kAlice, node(1), node(2)));
    EXPECT_EQ(throwing->calls, 1);
    EXPECT_EQ(events->size(), 1u);
    EXPECT_EQ(later->size(), 1u);
    EXPECT_EQ(composer.get_target(node(1)), std::optional<NodeId>(node(2)));
    EXPECT_EQ(items->owner_of(1), std::optional<Address>(composer.custody_address()));
}

TEST_F(ComposerTests, Events_NullSinkIsRejected)
{
    EXPECT_THROW(composer.add_event_sink(nullptr), std::invalid_argument);
    EXPECT_THROW(composer.set_authorization_policy(nullptr), std::invalid_argument);
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(ComposerTests, Queries_UnknownNodeIsItsOwnRoot)
{
    EXPECT_EQ(composer.find_root_token(node(6)), node(6));
    EXPECT_FALSE(composer.get_target(node(6)).has_value());
    EXPECT_TRUE(composer.children_of(node(6)).empty());
    EXPECT_TRUE(composer.attachments_of(node(6)).empty());
    EXPECT_FALSE(composer.is_quarantined(node(6)));
    EXPECT_EQ(composer.owner_of(node(6)), std::optional<Address>(kAlice));
    EXPECT_FALSE(composer.owner_of(node(99)).has_value());
}

TEST_F(ComposerTests, Queries_DoNotIntern)
{
    composer.find_root_token(node(5));
    composer.get_target(node(6));
    EXPECT_EQ(composer.registry().size(), 0u);
    EXPECT_EQ(composer.graph().node_count(), 0u);
}

TEST_F(ComposerTests, ExportState_EdgesRootsAndAttachments)
{
    composer.link(kAlice, node(1), node(2));
    composer.link(kAlice, node(3), node(2));
    composer.link_fungible(kAlice, kGold, 25, node(2));

    auto state = composer.export_state();
    ASSERT_EQ(state.edges.size(), 2u);
    EXPECT_EQ(state.edges[0].source, node(1));
    EXPECT_EQ(state.edges[1].source, node(3));

    ASSERT_EQ(state.roots.size(), 3u);
    for (const auto& record : state.roots)
    {
        EXPECT_EQ(record.root, node(2));
    }

    ASSERT_EQ(state.attachments.size(), 1u);
    EXPECT_EQ(state.attachments[0].owner, node(2));
    EXPECT_EQ(state.attachments[0].amount, 25);
    EXPECT_EQ(state.totals.at(ResourceKey::currency(kGold)), 25);
}

// ============================================================================
// Chain length bound and quarantine
// ============================================================================

TEST_F(ShallowComposerTests, Link_OverlongChainIsRejectedBeforeCustody)
{
    composer.link(kAlice, node(1), node(2));
    composer.link(kAlice, node(2), node(3));

    // 1 -> 2 -> 3 -> 4 would exceed the two-hop bound.
    EXPECT_EQ(code_of([&]() { composer.link(kAlice, node(3), node(4)); }),
              CompositionErrorCode::DepthLimitExceeded);
    EXPECT_EQ(items->owner_of(3), std::optional<Address>(kAlice));
    EXPECT_FALSE(composer.get_target(node(3)).has_value());
    EXPECT_FALSE(composer.is_quarantined(node(1)));
    EXPECT_EQ(events->size(), 2u);

    EXPECT_EQ(composer.find_root_token(node(1)), node(3));
    EXPECT_TRUE(composer.get_diagnostics()->is_valid());

    // Unlinking the bottom edge makes room.
    composer.unlink(kAlice, kAlice, node(1));
    composer.link(kAlice, node(3), node(4));
    EXPECT_EQ(composer.find_root_token(node(2)), node(4));
}

TEST_F(ShallowComposerTests, UpdateTarget_OverlongChainIsRejected)
{
    composer.link(kAlice, node(5), node(1));
    composer.link(kAlice, node(1), node(2));
    composer.link(kAlice, node(3), node(4));

    // Moving 1 (with child 5) under 3 would put node 5 three hops from 4.
    EXPECT_EQ(code_of([&]() { composer.update_target(kAlice, node(1), node(3)); }),
              CompositionErrorCode::DepthLimitExceeded);
    EXPECT_EQ(composer.get_target(node(1)), std::optional<NodeId>(node(2)));

    composer.update_target(kAlice, node(1), node(4));
    EXPECT_EQ(composer.find_root_token(node(5)), node(4));
}

TEST_F(ComposerTests, Quarantine_UnknownOrHealthyNodeIsNotQuarantined)
{
    composer.link(kAlice, node(1), node(2));
    EXPECT_FALSE(composer.is_quarantined(node(1)));
    EXPECT_FALSE(composer.is_quarantined(node(6)));
    EXPECT_FALSE(composer.clear_quarantine(node(1)));
    EXPECT_FALSE(composer.clear_quarantine(node(6)));
}

// ============================================================================
// Receiver callbacks
// ============================================================================

TEST_F(ComposerTests, Receiver_RejectsUnsolicitedToken)
{
    const Address& custody = composer.custody_address();
    EXPECT_THROW(items->transfer_from(kAlice, kAlice, custody, 6, {}), CustodyError);
    EXPECT_EQ(items->owner_of(6), std::optional<Address>(kAlice));
    EXPECT_THROW(gems->safe_transfer_from(kAlice, kAlice, custody, 42, 5, {}), CustodyError);
    EXPECT_EQ(gems->balance_of(kAlice, 42), 50);
}

TEST_F(ComposerTests, Receiver_AnswersMagicOnlyWhileExpectingCustody)
{
    EXPECT_EQ(composer.on_non_fungible_received(kAlice, kAlice, 1, {}), 0u);
    EXPECT_EQ(composer.on_counted_asset_received(kAlice, kAlice, 42, 1, {}), 0u);
}

TEST(ComposerConfigTests, Receiver_AcceptsUnsolicitedWhenConfigured)
{
    ComposerConfig config;
    config.accept_unsolicited_transfers = true;
    Composer composer(config);
    EXPECT_EQ(composer.on_non_fungible_received("alice", "alice", 1, {}), kNonFungibleReceivedMagic);
    EXPECT_EQ(composer.on_counted_asset_received("alice", "alice", 42, 1, {}), kCountedAssetReceivedMagic);
}

TEST(ComposerConfigTests, Construction_EmptyCustodyAddressThrows)
{
    ComposerConfig config;
    config.custody_address = "";
    EXPECT_THROW(Composer composer(config), std::invalid_argument);
}
