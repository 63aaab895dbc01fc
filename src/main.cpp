#include "composa/custody/in_memory_assets.hpp"
#include "composa/protocol/composer.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include <spdlog/spdlog.h>

using namespace composa;

namespace
{

const Address kAlice = "alice";
const Address kBob = "bob";
const Address kCollection = "items";
const Address kGold = "gold";

/// Expect `body` to fail with `expected`; log the outcome.
template <typename Func>
void expect_rejection(const char* label, CompositionErrorCode expected, Func&& body)
{
    try
    {
        body();
    }
    catch (const CompositionError& e)
    {
        if (e.code() != expected)
        {
            throw;
        }
        SPDLOG_INFO("{}: rejected with {} as expected", label, to_string(e.code()));
        return;
    }
    throw std::runtime_error(std::string(label) + ": operation unexpectedly succeeded");
}

void run_scenarios()
{
    auto items = std::make_shared<InMemoryNonFungibleAsset>(kCollection);
    auto gold = std::make_shared<InMemoryFungibleAsset>(kGold);

    Composer composer;
    composer.register_collection(items);
    composer.register_currency(gold);
    composer.set_authorization_policy(std::make_shared<RootOwnerPolicy>());
    auto log = std::make_shared<EventLog>();
    composer.add_event_sink(log);
    items->receivers().register_receiver(composer.custody_address(), &composer);

    const NodeId a{kCollection, 1};
    const NodeId b{kCollection, 2};
    const NodeId c{kCollection, 3};
    for (const NodeId& node : {a, b, c})
    {
        items->mint(kAlice, node.token_id);
    }
    items->set_approval_for_all(kAlice, composer.custody_address(), true);

    // Scenario 1: link A -> B.
    composer.link(kAlice, a, b);
    SPDLOG_INFO("root of {} is {}", to_string(a), to_string(composer.find_root_token(a)));
    SPDLOG_INFO("root of {} is {}", to_string(b), to_string(composer.find_root_token(b)));

    // Scenario 2: B -> A would close a cycle.
    expect_rejection("link B -> A", CompositionErrorCode::CycleDetected,
                     [&]() { composer.link(kAlice, b, a); });

    // Scenario 3: a second link out of A must go through update_target.
    expect_rejection("link A -> C", CompositionErrorCode::AlreadyLinked,
                     [&]() { composer.link(kAlice, a, c); });
    composer.update_target(kAlice, a, c);
    SPDLOG_INFO("target of {} is now {}", to_string(a), to_string(*composer.get_target(a)));

    // Scenario 4: attach 100 gold to A, then pay it out to Bob.
    gold->mint(kAlice, 100);
    gold->approve(kAlice, composer.custody_address(), 100);
    composer.link_fungible(kAlice, kGold, 100, a);
    Amount paid = composer.unlink_fungible(kAlice, kBob, kGold, a);
    SPDLOG_INFO("paid {} gold to {}; balance of {} is {}", paid, kBob, to_string(a),
                composer.balance_of_fungible(a, kGold));

    // Scenario 5: unlink a node that has no target.
    expect_rejection("unlink C", CompositionErrorCode::NotLinked,
                     [&]() { composer.unlink(kAlice, kAlice, c); });

    composer.unlink(kAlice, kAlice, a);
    auto diagnostics = composer.get_diagnostics();
    SPDLOG_INFO("{} event(s) emitted; diagnostics {}", log->size(),
                diagnostics->is_valid() ? "clean" : "report errors");
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        spdlog::set_level(spdlog::level::info);
        for (int i = 1; i < argc; ++i)
        {
            if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0)
            {
                spdlog::set_level(spdlog::level::debug);
            }
        }

        std::cout << "\n\n====== composa ======\n" << std::flush;

        run_scenarios();

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
