/**
 * @file authorization_tests.cpp
 * Unit tests for the authorization policies consulted by the Composer.
 */
#include "composer_test_fixture.hpp"

using namespace composa;
using namespace composa_test;

namespace
{

/**
 * @brief Policy that denies everything and remembers what it was asked.
 */
class DenyAllPolicy : public IAuthorizationPolicy
{
public:
    bool authorize(const Composer&, const OperationRequest& request) const override
    {
        requests.push_back(request);
        return false;
    }

    mutable std::vector<OperationRequest> requests;
};

} // namespace

class AuthorizationTests : public ComposerFixture
{
protected:
    void use_root_owner_policy()
    {
        composer.set_authorization_policy(std::make_shared<RootOwnerPolicy>());
    }
};

// ============================================================================
// Policy plumbing
// ============================================================================

TEST_F(AuthorizationTests, Default_AllowsAnyActor)
{
    composer.link(kBob, node(1), node(2));
    EXPECT_EQ(composer.find_root_token(node(1)), node(2));
}

TEST_F(AuthorizationTests, Deny_IsUnauthorizedAndAsksAfterValidation)
{
    auto policy = std::make_shared<DenyAllPolicy>();
    composer.set_authorization_policy(policy);

    EXPECT_EQ(code_of([&]() { composer.link(kAlice, node(1), node(1)); }),
              CompositionErrorCode::SelfLink);
    EXPECT_TRUE(policy->requests.empty());

    EXPECT_EQ(code_of([&]() { composer.link(kAlice, node(1), node(2)); }),
              CompositionErrorCode::Unauthorized);
    ASSERT_EQ(policy->requests.size(), 1u);
    EXPECT_EQ(policy->requests[0].operation, CompositionOperation::Link);
    EXPECT_EQ(policy->requests[0].actor, kAlice);
    EXPECT_EQ(policy->requests[0].subject, node(1));
    EXPECT_EQ(policy->requests[0].target, std::optional<NodeId>(node(2)));

    EXPECT_EQ(items->owner_of(1), std::optional<Address>(kAlice));
    EXPECT_FALSE(composer.get_target(node(1)).has_value());
    EXPECT_TRUE(events->events().empty());
}

TEST_F(AuthorizationTests, Deny_AttachmentRequestCarriesResource)
{
    auto policy = std::make_shared<DenyAllPolicy>();
    composer.set_authorization_policy(policy);

    EXPECT_EQ(code_of([&]() { composer.link_counted(kAlice, kGems, 42, 5, node(1)); }),
              CompositionErrorCode::Unauthorized);
    ASSERT_EQ(policy->requests.size(), 1u);
    EXPECT_EQ(policy->requests[0].kind, ResourceKind::CountedAsset);
    EXPECT_EQ(policy->requests[0].resource,
              std::optional<ResourceKey>(ResourceKey::counted(kGems, 42)));
    EXPECT_EQ(gems->balance_of(kAlice, 42), 50);
}

// ============================================================================
// RootOwnerPolicy
// ============================================================================

TEST_F(AuthorizationTests, RootOwner_LinkRequiresHolderOfSource)
{
    use_root_owner_policy();
    EXPECT_EQ(code_of([&]() { composer.link(kBob, node(1), node(2)); }),
              CompositionErrorCode::Unauthorized);
    composer.link(kAlice, node(1), node(2));
    composer.link(kBob, node(7), node(1));
    EXPECT_EQ(composer.find_root_token(node(7)), node(2));
}

TEST_F(AuthorizationTests, RootOwner_UpdateAndUnlinkRequireRootOwner)
{
    use_root_owner_policy();
    composer.link(kAlice, node(1), node(2));

    EXPECT_EQ(code_of([&]() { composer.update_target(kBob, node(1), node(3)); }),
              CompositionErrorCode::Unauthorized);
    EXPECT_EQ(code_of([&]() { composer.unlink(kBob, kBob, node(1)); }),
              CompositionErrorCode::Unauthorized);

    composer.update_target(kAlice, node(1), node(3));
    composer.unlink(kAlice, kAlice, node(1));
    EXPECT_EQ(items->owner_of(1), std::optional<Address>(kAlice));
}

TEST_F(AuthorizationTests, RootOwner_OwnershipFollowsRoot)
{
    use_root_owner_policy();
    // Bob's node 7 under Alice's node 1: Alice now owns the tree.
    composer.link(kBob, node(7), node(1));
    EXPECT_EQ(composer.owner_of(node(7)), std::optional<Address>(kAlice));

    EXPECT_EQ(code_of([&]() { composer.unlink(kBob, kBob, node(7)); }),
              CompositionErrorCode::Unauthorized);
    composer.unlink(kAlice, kBob, node(7));
    EXPECT_EQ(items->owner_of(7), std::optional<Address>(kBob));
}

TEST_F(AuthorizationTests, RootOwner_AttachmentsDepositAnywhereWithdrawByOwner)
{
    use_root_owner_policy();
    composer.link_fungible(kBob, kGold, 50, node(1));

    EXPECT_EQ(code_of([&]() { composer.unlink_fungible(kBob, kBob, kGold, node(1)); }),
              CompositionErrorCode::Unauthorized);
    EXPECT_EQ(code_of([&]() { composer.update_fungible_target(kBob, kGold, node(1), node(7)); }),
              CompositionErrorCode::Unauthorized);

    composer.update_fungible_target(kAlice, kGold, node(1), node(2));
    EXPECT_EQ(composer.unlink_fungible(kAlice, kAlice, kGold, node(2)), 50);
    EXPECT_EQ(gold->balance_of(kAlice), 1050);
    EXPECT_EQ(gold->balance_of(kBob), 950);
}
