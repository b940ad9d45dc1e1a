// Launchpad - Destination Gateway and Event Source Tests

#include <catch2/catch_test_macros.hpp>
#include <launchpad/errors.hpp>
#include <launchpad/gateway.hpp>
#include <launchpad/launch.hpp>

#include <chrono>
#include <memory>
#include <thread>

using namespace launchpad;

namespace {

Address make_address(uint8_t tag) {
    Address addr{};
    addr[19] = tag;
    return addr;
}

const Address kAdmin = make_address(0xad);
const Address kCoordinator = make_address(0xc0);

struct GatewayFixture {
    std::shared_ptr<AllowList> allow_list = std::make_shared<AllowList>(kAdmin);
    std::shared_ptr<DestinationGateway> gateway;

    GatewayFixture() {
        allow_list->authorize(kAdmin, kCoordinator, true);
        gateway = std::make_shared<DestinationGateway>(97, allow_list);
    }

    DeployRequest request(LaunchId id) const {
        return DeployRequest{id, "Moon Token", "MOON", make_address(0xc1),
                             make_address(0x7e), 11155111, deployment_salt(id, 97)};
    }
};

} // namespace

TEST_CASE("Gateway deploys once per launch", "[gateway]") {
    GatewayFixture f;
    DeployRequest req = f.request(1);

    DeployedAddresses addresses = f.gateway->deploy_token(kCoordinator, req);
    REQUIRE(addresses.token_address == predict_token_address(req.salt));
    REQUIRE(addresses.curve_address == predict_curve_address(req.salt));

    try {
        f.gateway->deploy_token(kCoordinator, req);
        FAIL("expected StateError");
    } catch (const StateError& e) {
        REQUIRE(e.code() == errors::ALREADY_DEPLOYED);
    }

    auto token = f.gateway->token(1);
    REQUIRE(token.has_value());
    REQUIRE(token->request.symbol == "MOON");
    REQUIRE_FALSE(token->migrated);
    REQUIRE(f.gateway->get_stats().deployments == 1);

    SECTION("Invalid requests") {
        DeployRequest bad = f.request(2);
        bad.symbol.clear();
        REQUIRE_THROWS_AS(f.gateway->deploy_token(kCoordinator, bad), ValidationError);
        bad = f.request(3);
        bad.creator = Address{};
        REQUIRE_THROWS_AS(f.gateway->deploy_token(kCoordinator, bad), ValidationError);
    }
}

TEST_CASE("Gateway drops stale price syncs", "[gateway]") {
    GatewayFixture f;
    f.gateway->deploy_token(kCoordinator, f.request(1));

    REQUIRE(f.gateway->sync_price(kCoordinator, PriceSync{1, 1300000000, 5 * WAD, 7}));
    REQUIRE_FALSE(f.gateway->sync_price(kCoordinator, PriceSync{1, 1200000000, 4 * WAD, 5}));
    REQUIRE_FALSE(f.gateway->sync_price(kCoordinator, PriceSync{1, 1200000000, 4 * WAD, 7}));

    auto cursor = f.gateway->cursor(1);
    REQUIRE(cursor->last_applied_seq == 7);
    REQUIRE(cursor->last_price == 1300000000);
    REQUIRE(cursor->last_total_supply == 5 * WAD);

    auto stats = f.gateway->get_stats();
    REQUIRE(stats.syncs_applied == 1);
    REQUIRE(stats.syncs_dropped == 2);

    SECTION("Sync for an unknown launch") {
        try {
            f.gateway->sync_price(kCoordinator, PriceSync{99, 1, 1, 1});
            FAIL("expected ValidationError");
        } catch (const ValidationError& e) {
            REQUIRE(e.code() == errors::NOT_FOUND);
        }
    }
}

TEST_CASE("Gateway migrates once", "[gateway]") {
    GatewayFixture f;
    DeployRequest req = f.request(1);
    f.gateway->deploy_token(kCoordinator, req);
    f.gateway->sync_price(kCoordinator, PriceSync{1, 1500000000, 8 * WAD, 3});

    DexMigrationResult result = f.gateway->migrate_to_dex(kCoordinator, 1);
    REQUIRE(result.liquidity_pair == predict_pair_address(req.salt));
    REQUIRE(result.final_price == 1500000000);
    REQUIRE(result.liquidity_tokens == supply::LIQUIDITY_RESERVE);
    REQUIRE(f.gateway->token(1)->migrated);

    try {
        f.gateway->migrate_to_dex(kCoordinator, 1);
        FAIL("expected StateError");
    } catch (const StateError& e) {
        REQUIRE(e.code() == errors::ALREADY_MIGRATED);
    }
    REQUIRE(f.gateway->get_stats().migrations == 1);
    REQUIRE_THROWS_AS(f.gateway->migrate_to_dex(kCoordinator, 2), ValidationError);
}

TEST_CASE("Gateway rejects unknown callers", "[gateway][access]") {
    GatewayFixture f;
    Address stranger = make_address(0x66);

    REQUIRE_THROWS_AS(f.gateway->deploy_token(stranger, f.request(1)), AuthorizationError);
    REQUIRE_FALSE(f.gateway->token(1).has_value());

    f.gateway->deploy_token(kCoordinator, f.request(1));
    REQUIRE_THROWS_AS(f.gateway->sync_price(stranger, PriceSync{1, 1, 1, 1}), AuthorizationError);
    REQUIRE_THROWS_AS(f.gateway->migrate_to_dex(stranger, 1), AuthorizationError);
    REQUIRE_FALSE(f.gateway->cursor(1).has_value());
    REQUIRE(f.gateway->get_stats().rejected_callers == 3);

    SECTION("Revoked caller") {
        f.allow_list->authorize(kAdmin, kCoordinator, false);
        REQUIRE_THROWS_AS(f.gateway->sync_price(kCoordinator, PriceSync{1, 1, 1, 2}),
                          AuthorizationError);
    }
}

TEST_CASE("LocalChainClient forwards to the gateway", "[gateway]") {
    GatewayFixture f;
    LocalChainClient client(f.gateway);

    REQUIRE(client.chain_id() == 97);
    DeployedAddresses addresses = client.deploy_token(kCoordinator, f.request(4));
    REQUIRE(addresses.token_address == f.gateway->token(4)->addresses.token_address);

    REQUIRE_NOTHROW(client.sync_price(kCoordinator, PriceSync{4, 10, 10, 1}));
    REQUIRE_NOTHROW(client.sync_price(kCoordinator, PriceSync{4, 10, 10, 1}));
    REQUIRE(f.gateway->get_stats().syncs_dropped == 1);

    REQUIRE_THROWS_AS(LocalChainClient(nullptr), ValidationError);
}

TEST_CASE("QueueEventSource", "[events]") {
    QueueEventSource source(97);
    REQUIRE(source.chain_id() == 97);
    REQUIRE_FALSE(source.closed());

    SECTION("Times out when empty") {
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(source.next(std::chrono::milliseconds(20)).has_value());
        REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(15));
    }

    SECTION("Delivers in push order") {
        source.push(ChainEvent{97, kCoordinator, TokenSale{1, make_address(1), 1, 1, 1, 1}});
        source.push(ChainEvent{97, kCoordinator, TokenSale{1, make_address(1), 1, 1, 1, 2}});
        REQUIRE(source.pending() == 2);

        auto first = source.next(std::chrono::milliseconds(10));
        REQUIRE(first.has_value());
        REQUIRE(std::get<TokenSale>(first->payload).seq == 1);
        REQUIRE(std::get<TokenSale>(source.next(std::chrono::milliseconds(10))->payload).seq == 2);
    }

    SECTION("Wakes a waiting consumer") {
        std::thread producer([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            source.push(ChainEvent{97, kCoordinator, CurveMigrationTriggered{5, 1, 2, 3}});
        });
        auto event = source.next(std::chrono::seconds(2));
        producer.join();
        REQUIRE(event.has_value());
        REQUIRE(event->launch_id() == 5);
    }

    SECTION("Close drains then reports closed") {
        source.push(ChainEvent{97, kCoordinator, CurveMigrationTriggered{5, 1, 2, 3}});
        source.close();
        REQUIRE_FALSE(source.closed());
        source.push(ChainEvent{97, kCoordinator, CurveMigrationTriggered{6, 1, 2, 3}});
        REQUIRE(source.pending() == 1);
        REQUIRE(source.next(std::chrono::milliseconds(10)).has_value());
        REQUIRE(source.closed());
        REQUIRE_FALSE(source.next(std::chrono::milliseconds(10)).has_value());
    }
}
