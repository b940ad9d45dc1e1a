// Launchpad - Registry, Launch and Access Tests

#include <catch2/catch_test_macros.hpp>
#include <launchpad/access.hpp>
#include <launchpad/errors.hpp>
#include <launchpad/launch.hpp>
#include <launchpad/registry.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace launchpad;

namespace {

Address make_address(uint8_t tag) {
    Address addr{};
    addr[19] = tag;
    return addr;
}

Launch make_launch(LaunchId id = 1001) {
    Launch launch;
    launch.launch_id = id;
    launch.creator = make_address(0xc1);
    launch.name = "Moon Token";
    launch.symbol = "MOON";
    launch.origin_chain_id = 11155111;
    launch.target_chain_ids = {97, 80002};
    launch.created_at = 1700000000;
    return launch;
}

DeployedAddresses predicted(uint64_t salt) {
    return {predict_token_address(salt), predict_curve_address(salt)};
}

} // namespace

TEST_CASE("DeploymentRegistry deploys at most once", "[registry]") {
    DeploymentRegistry registry;
    CurveKey key{1001, 97};
    uint64_t salt = deployment_salt(key.launch_id, key.chain_id);
    int calls = 0;

    DeployOutcome first = registry.try_deploy(key, salt, [&] {
        ++calls;
        return predicted(salt);
    });
    REQUIRE(first.created);
    REQUIRE(first.record.status == DeploymentStatus::Deployed);
    REQUIRE(first.record.attempts == 1);
    REQUIRE(first.record.token_address == predict_token_address(salt));

    DeployOutcome second = registry.try_deploy(key, salt, [&] {
        ++calls;
        return predicted(salt);
    });
    REQUIRE_FALSE(second.created);
    REQUIRE(second.record.token_address == first.record.token_address);
    REQUIRE(calls == 1);
    REQUIRE(registry.is_deployed(key));
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Concurrent deploys of one key call the deployer once", "[registry]") {
    DeploymentRegistry registry;
    CurveKey key{2002, 80002};
    std::atomic<int> calls{0};
    std::atomic<int> created{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&] {
            DeployOutcome out = registry.try_deploy(key, 7, [&] {
                ++calls;
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                return predicted(7);
            });
            if (out.created) ++created;
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(calls.load() == 1);
    REQUIRE(created.load() == 1);
}

TEST_CASE("Failed deployment is retried", "[registry]") {
    DeploymentRegistry registry;
    CurveKey key{3003, 97};

    REQUIRE_THROWS_AS(registry.try_deploy(key, 9, []() -> DeployedAddresses {
        throw NetworkError("relayer unreachable");
    }), NetworkError);

    auto failed = registry.get(key);
    REQUIRE(failed.has_value());
    REQUIRE(failed->status == DeploymentStatus::Failed);
    REQUIRE(failed->last_error == "relayer unreachable");
    REQUIRE_FALSE(registry.is_deployed(key));

    DeployOutcome retry = registry.try_deploy(key, 9, [] { return predicted(9); });
    REQUIRE(retry.created);
    REQUIRE(retry.record.attempts == 2);
    REQUIRE(retry.record.last_error.empty());
    REQUIRE(std::string(to_string(retry.record.status)) == "deployed");
}

TEST_CASE("DeploymentRegistry bulk load", "[registry]") {
    DeploymentRegistry registry;
    CurveKey a{4004, 97};
    CurveKey b{4004, 80002};
    registry.try_deploy(a, 1, [] { return predicted(1); });

    DeploymentRecord ra{a, make_address(1), make_address(2), 1, 1, DeploymentStatus::Deployed, 1, {}};
    DeploymentRecord rb{b, make_address(3), make_address(4), 2, 1, DeploymentStatus::Deployed, 1, {}};
    REQUIRE(registry.register_batch({ra, rb}) == 1);

    // Existing record untouched
    REQUIRE(registry.get(a)->token_address == predict_token_address(1));
    REQUIRE(registry.get(b)->token_address == make_address(3));

    auto records = registry.records_for_launch(4004);
    REQUIRE(records.size() == 2);
    REQUIRE(registry.records_for_launch(5005).empty());
}

TEST_CASE("SyncLedger applies only newer sequences", "[registry]") {
    SyncLedger ledger;
    CurveKey key{1001, 80002};

    REQUIRE(ledger.is_fresh(key, 1));
    REQUIRE_FALSE(ledger.is_fresh(key, 0));

    REQUIRE(ledger.try_advance(key, 7, 100, 1250000000, 5));
    REQUIRE_FALSE(ledger.try_advance(key, 5, 200, 1, 1));
    REQUIRE_FALSE(ledger.try_advance(key, 7, 200, 1, 1));

    auto cursor = ledger.cursor(key);
    REQUIRE(cursor.has_value());
    REQUIRE(cursor->last_applied_seq == 7);
    REQUIRE(cursor->last_applied_timestamp == 100);
    REQUIRE(cursor->last_price == 1250000000);
    REQUIRE(cursor->last_total_supply == 5);

    REQUIRE(ledger.try_advance(key, 8, 300));
    REQUIRE(ledger.cursor(key)->last_applied_seq == 8);

    SECTION("Bulk registration") {
        REQUIRE(ledger.register_batch({key, {1001, 97}}) == 1);
        REQUIRE(ledger.size() == 2);
        REQUIRE(ledger.cursor(CurveKey{1001, 97})->last_applied_seq == 0);
    }
}

TEST_CASE("Deterministic identifiers", "[launch]") {
    Address creator = make_address(0xc1);

    LaunchId id = compute_launch_id(creator, 1, 1700000000);
    REQUIRE(id == compute_launch_id(creator, 1, 1700000000));
    REQUIRE(id != compute_launch_id(creator, 2, 1700000000));
    REQUIRE(id != compute_launch_id(make_address(0xc2), 1, 1700000000));

    uint64_t salt = deployment_salt(id, 97);
    REQUIRE(salt == deployment_salt(id, 97));
    REQUIRE(salt != deployment_salt(id, 80002));

    REQUIRE(predict_token_address(salt) == predict_token_address(salt));
    REQUIRE(predict_token_address(salt) != predict_curve_address(salt));
    REQUIRE(predict_curve_address(salt) != predict_pair_address(salt));
    REQUIRE_FALSE(is_zero_address(predict_token_address(salt)));
}

TEST_CASE("LaunchRegistry", "[launch]") {
    LaunchRegistry registry;
    Launch launch = make_launch();

    REQUIRE(registry.register_launch(launch) == errors::OK);

    Launch again = launch;
    again.name = "Other";
    REQUIRE(registry.register_launch(again) == errors::ALREADY_REGISTERED);
    REQUIRE(registry.get(launch.launch_id)->name == "Moon Token");
    REQUIRE(registry.size() == 1);

    std::vector<ChainId> chains = registry.chains_for(launch.launch_id);
    std::vector<ChainId> expected{11155111, 97, 80002};
    REQUIRE(chains == expected);
    REQUIRE(registry.chains_for(42).empty());

    SECTION("Origin listed among targets is not duplicated") {
        Launch overlap = make_launch(1002);
        overlap.target_chain_ids.insert(11155111);
        REQUIRE(overlap.all_chains().size() == 3);
    }

    SECTION("Validation") {
        Launch bad = make_launch(2);
        bad.name = "";
        REQUIRE_THROWS_AS(registry.register_launch(bad), ValidationError);

        bad = make_launch(3);
        bad.symbol = "WAYTOOLONGSYM";
        REQUIRE_THROWS_AS(registry.register_launch(bad), ValidationError);

        bad = make_launch(4);
        bad.creator = Address{};
        try {
            registry.register_launch(bad);
            FAIL("expected ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.code() == errors::ZERO_ADDRESS);
        }

        bad = make_launch(5);
        bad.target_chain_ids.clear();
        REQUIRE_THROWS_AS(registry.register_launch(bad), ValidationError);
        REQUIRE(registry.size() == 1);
    }
}

TEST_CASE("AllowList", "[access]") {
    Address admin = make_address(0xad);
    Address relayer = make_address(0xe1);
    AllowList list(admin);

    REQUIRE_FALSE(list.is_authorized(relayer));
    REQUIRE_THROWS_AS(list.require(relayer), AuthorizationError);

    list.authorize(admin, relayer, true);
    REQUIRE(list.is_authorized(relayer));
    REQUIRE_NOTHROW(list.require(relayer));
    REQUIRE(list.callers().size() == 1);

    SECTION("Only the admin may change the list") {
        REQUIRE_THROWS_AS(list.authorize(relayer, make_address(0xe2), true), AuthorizationError);
        REQUIRE_FALSE(list.is_authorized(make_address(0xe2)));
    }

    SECTION("Revocation") {
        list.authorize(admin, relayer, false);
        REQUIRE_FALSE(list.is_authorized(relayer));
    }

    SECTION("Zero addresses") {
        REQUIRE_THROWS_AS(list.authorize(admin, Address{}, true), ValidationError);
        REQUIRE_THROWS_AS(AllowList(Address{}), ValidationError);
    }
}
