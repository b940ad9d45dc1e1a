// Launchpad - Wire Codec Tests

#include <catch2/catch_test_macros.hpp>
#include <launchpad/codec.hpp>
#include <launchpad/errors.hpp>
#include <launchpad/math.hpp>
#include <nlohmann/json.hpp>

#include <variant>

using namespace launchpad;
using json = nlohmann::json;

namespace {

Address make_address(uint8_t tag) {
    Address addr{};
    addr[0] = 0xab;
    addr[19] = tag;
    return addr;
}

} // namespace

TEST_CASE("Purchase event survives the wire", "[codec]") {
    TokenPurchase purchase{42, make_address(0x01), WAD / 100,
                           math::parse_u128("7685451124096266217688423"), 1274367612, 3};
    ChainEvent event{97, make_address(0xe1), purchase};

    json j = codec::encode_event(event);
    REQUIRE(j["type"] == "TokenPurchase");
    REQUIRE(j["launchId"] == "42");
    REQUIRE(j["chainId"] == 97);
    REQUIRE(j["ethIn"] == "10000000000000000");
    REQUIRE(j["tokensOut"] == "7685451124096266217688423");

    ChainEvent back = codec::from_wire(codec::to_wire(event));
    REQUIRE(back.chain_id == 97);
    REQUIRE(back.caller == event.caller);
    REQUIRE(back.launch_id() == 42);
    REQUIRE(std::string(back.type_name()) == "TokenPurchase");

    const auto* p = std::get_if<TokenPurchase>(&back.payload);
    REQUIRE(p != nullptr);
    REQUIRE(p->tokens_out == purchase.tokens_out);
    REQUIRE(p->seq == 3);
}

TEST_CASE("Relayer payloads decode", "[codec]") {
    SECTION("TokenCreated with numeric launch id") {
        json j = {
            {"type", "TokenCreated"},
            {"chainId", 11155111},
            {"caller", "0x0000000000000000000000000000000000000e01"},
            {"launchId", 77},
            {"name", "Moon Token"},
            {"symbol", "MOON"},
            {"creator", "0x00000000000000000000000000000000000000c1"},
            {"originChainId", 11155111},
            {"targetChainIds", {97, 80002}}
        };
        ChainEvent event = codec::decode_event(j);
        const auto& created = std::get<TokenCreated>(event.payload);
        REQUIRE(created.launch_id == 77);
        REQUIRE(created.symbol == "MOON");
        REQUIRE(created.target_chain_ids.size() == 2);
        REQUIRE(created.timestamp == 0);
        REQUIRE(event.caller[19] == 0x01);
        REQUIRE(event.caller[18] == 0x0e);
    }

    SECTION("CurveMigrationTriggered") {
        std::string wire = R"({"type":"CurveMigrationTriggered","chainId":97,)"
                           R"("caller":"0x0000000000000000000000000000000000000e01",)"
                           R"("launchId":"18446744073709551615","finalPrice":"2000",)"
                           R"("liquidityEth":"3000","liquidityTokens":"4000"})";
        ChainEvent event = codec::from_wire(wire);
        REQUIRE(event.launch_id() == UINT64_MAX);
        const auto& m = std::get<CurveMigrationTriggered>(event.payload);
        REQUIRE(m.final_price == 2000);
        REQUIRE(m.liquidity_tokens == 4000);
    }
}

TEST_CASE("Malformed events are rejected", "[codec]") {
    SECTION("Not JSON") {
        REQUIRE_THROWS_AS(codec::from_wire("{not json"), ValidationError);
    }

    SECTION("Unknown type") {
        json j = {{"type", "TokenBurned"}, {"chainId", 1},
                  {"caller", "0x0000000000000000000000000000000000000e01"}, {"launchId", "1"}};
        REQUIRE_THROWS_AS(codec::decode_event(j), ValidationError);
    }

    SECTION("Missing field") {
        json j = {{"type", "TokenSale"}, {"chainId", 1},
                  {"caller", "0x0000000000000000000000000000000000000e01"}, {"launchId", "1"}};
        REQUIRE_THROWS_AS(codec::decode_event(j), ValidationError);
    }

    SECTION("Bad amount") {
        TokenSale sale{1, make_address(2), 5, 6, 7, 1};
        json j = codec::encode_event(ChainEvent{1, make_address(3), sale});
        j["ethOut"] = "12x";
        REQUIRE_THROWS_AS(codec::decode_event(j), ValidationError);
    }

    SECTION("Bad address") {
        TokenSale sale{1, make_address(2), 5, 6, 7, 1};
        json j = codec::encode_event(ChainEvent{1, make_address(3), sale});
        j["seller"] = "0x1234";
        REQUIRE_THROWS_AS(codec::decode_event(j), ValidationError);
    }

    SECTION("Launch id out of range") {
        TokenSale sale{1, make_address(2), 5, 6, 7, 1};
        json j = codec::encode_event(ChainEvent{1, make_address(3), sale});
        j["launchId"] = "18446744073709551616";
        REQUIRE_THROWS_AS(codec::decode_event(j), ValidationError);
    }
}

TEST_CASE("Callback bodies", "[codec]") {
    Address caller = make_address(0xc0);

    DeployRequest req{5, "Moon Token", "MOON", make_address(0xc1), make_address(0x7e), 11155111, 99};
    json deploy = codec::encode_deploy(caller, req);
    REQUIRE(deploy["launchId"] == "5");
    REQUIRE(deploy["salt"] == "99");
    REQUIRE(deploy["originChainId"] == 11155111);
    REQUIRE(deploy["caller"] == to_hex(caller));

    json sync = codec::encode_sync(caller, PriceSync{5, 1274367612, WAD, 12});
    REQUIRE(sync["price"] == "1274367612");
    REQUIRE(sync["totalSupply"] == "1000000000000000000");
    REQUIRE(sync["seq"] == 12);

    json migrate = codec::encode_migrate(caller, 5);
    REQUIRE(migrate["launchId"] == "5");

    SECTION("Responses") {
        json addresses = {{"tokenAddress", to_hex(make_address(1))},
                          {"curveAddress", to_hex(make_address(2))}};
        DeployedAddresses decoded = codec::decode_addresses(addresses);
        REQUIRE(decoded.token_address == make_address(1));
        REQUIRE(decoded.curve_address == make_address(2));

        REQUIRE_THROWS_AS(codec::decode_addresses(json{{"tokenAddress", 5}}), ValidationError);

        DexMigrationResult pair = codec::decode_migration(
            json{{"liquidityPair", to_hex(make_address(9))}, {"finalPrice", "10"}});
        REQUIRE(pair.liquidity_pair == make_address(9));
        REQUIRE(pair.final_price == 10);
        REQUIRE(pair.liquidity_eth == 0);
    }
}
