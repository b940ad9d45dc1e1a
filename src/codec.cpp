// Launchpad - JSON Wire Codec

#include "launchpad/codec.hpp"
#include "launchpad/errors.hpp"
#include "launchpad/math.hpp"

#include <nlohmann/json.hpp>
#include <type_traits>

namespace launchpad::codec {

using json = nlohmann::json;

namespace {

std::string amount(U128 value) {
    return math::to_string(value);
}

U128 read_amount(const json& j, const char* field) {
    return math::parse_u128(j.at(field).get<std::string>());
}

Address read_address(const json& j, const char* field) {
    return address_from_hex(j.at(field).get<std::string>());
}

LaunchId read_launch_id(const json& j) {
    const auto& v = j.at("launchId");
    if (v.is_string()) {
        U128 id = math::parse_u128(v.get<std::string>());
        if (id > UINT64_MAX) {
            throw ValidationError("launchId out of range", errors::INVALID_ARGUMENT);
        }
        return static_cast<LaunchId>(id);
    }
    return v.get<LaunchId>();
}

json encode_payload(const EventPayload& payload) {
    return std::visit([](const auto& e) -> json {
        using T = std::decay_t<decltype(e)>;
        json j;
        j["launchId"] = std::to_string(e.launch_id);
        if constexpr (std::is_same_v<T, TokenCreated>) {
            j["type"] = "TokenCreated";
            j["name"] = e.name;
            j["symbol"] = e.symbol;
            j["creator"] = to_hex(e.creator);
            j["originChainId"] = e.origin_chain_id;
            j["targetChainIds"] = e.target_chain_ids;
            j["timestamp"] = e.timestamp;
        } else if constexpr (std::is_same_v<T, TokenPurchase>) {
            j["type"] = "TokenPurchase";
            j["buyer"] = to_hex(e.buyer);
            j["ethIn"] = amount(e.eth_in);
            j["tokensOut"] = amount(e.tokens_out);
            j["price"] = amount(e.price);
            j["seq"] = e.seq;
        } else if constexpr (std::is_same_v<T, TokenSale>) {
            j["type"] = "TokenSale";
            j["seller"] = to_hex(e.seller);
            j["tokensIn"] = amount(e.tokens_in);
            j["ethOut"] = amount(e.eth_out);
            j["price"] = amount(e.price);
            j["seq"] = e.seq;
        } else {
            j["type"] = "CurveMigrationTriggered";
            j["finalPrice"] = amount(e.final_price);
            j["liquidityEth"] = amount(e.liquidity_eth);
            j["liquidityTokens"] = amount(e.liquidity_tokens);
        }
        return j;
    }, payload);
}

EventPayload decode_payload(const json& j) {
    std::string type = j.at("type").get<std::string>();
    LaunchId launch_id = read_launch_id(j);

    if (type == "TokenCreated") {
        TokenCreated e;
        e.launch_id = launch_id;
        e.name = j.at("name").get<std::string>();
        e.symbol = j.at("symbol").get<std::string>();
        e.creator = read_address(j, "creator");
        e.origin_chain_id = j.at("originChainId").get<ChainId>();
        e.target_chain_ids = j.at("targetChainIds").get<std::vector<ChainId>>();
        e.timestamp = j.value("timestamp", uint64_t(0));
        return e;
    }
    if (type == "TokenPurchase") {
        return TokenPurchase{launch_id, read_address(j, "buyer"), read_amount(j, "ethIn"),
                             read_amount(j, "tokensOut"), read_amount(j, "price"),
                             j.at("seq").get<uint64_t>()};
    }
    if (type == "TokenSale") {
        return TokenSale{launch_id, read_address(j, "seller"), read_amount(j, "tokensIn"),
                         read_amount(j, "ethOut"), read_amount(j, "price"),
                         j.at("seq").get<uint64_t>()};
    }
    if (type == "CurveMigrationTriggered") {
        return CurveMigrationTriggered{launch_id, read_amount(j, "finalPrice"),
                                       read_amount(j, "liquidityEth"),
                                       read_amount(j, "liquidityTokens")};
    }
    throw ValidationError("unknown event type: " + type);
}

} // anonymous namespace

// =============================================================================
// Events
// =============================================================================

json encode_event(const ChainEvent& event) {
    json j = encode_payload(event.payload);
    j["chainId"] = event.chain_id;
    j["caller"] = to_hex(event.caller);
    return j;
}

ChainEvent decode_event(const json& j) {
    try {
        ChainEvent event{j.at("chainId").get<ChainId>(), read_address(j, "caller"),
                         decode_payload(j)};
        return event;
    } catch (const json::exception& e) {
        throw ValidationError(std::string("malformed event: ") + e.what());
    }
}

std::string to_wire(const ChainEvent& event) {
    return encode_event(event).dump();
}

ChainEvent from_wire(std::string_view text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw ValidationError("event is not valid JSON");
    }
    return decode_event(j);
}

// =============================================================================
// Callbacks
// =============================================================================

json encode_deploy(const Address& caller, const DeployRequest& request) {
    return {
        {"caller", to_hex(caller)},
        {"launchId", std::to_string(request.launch_id)},
        {"name", request.name},
        {"symbol", request.symbol},
        {"creator", to_hex(request.creator)},
        {"originToken", to_hex(request.origin_token)},
        {"originChainId", request.origin_chain_id},
        {"salt", std::to_string(request.salt)}
    };
}

json encode_sync(const Address& caller, const PriceSync& sync) {
    return {
        {"caller", to_hex(caller)},
        {"launchId", std::to_string(sync.launch_id)},
        {"price", amount(sync.price)},
        {"totalSupply", amount(sync.total_supply)},
        {"seq", sync.seq}
    };
}

json encode_migrate(const Address& caller, LaunchId launch_id) {
    return {
        {"caller", to_hex(caller)},
        {"launchId", std::to_string(launch_id)}
    };
}

DeployedAddresses decode_addresses(const json& j) {
    try {
        return {read_address(j, "tokenAddress"), read_address(j, "curveAddress")};
    } catch (const json::exception& e) {
        throw ValidationError(std::string("malformed deploy response: ") + e.what());
    }
}

DexMigrationResult decode_migration(const json& j) {
    try {
        DexMigrationResult result{};
        result.liquidity_pair = read_address(j, "liquidityPair");
        if (j.contains("finalPrice")) result.final_price = read_amount(j, "finalPrice");
        if (j.contains("liquidityEth")) result.liquidity_eth = read_amount(j, "liquidityEth");
        if (j.contains("liquidityTokens")) result.liquidity_tokens = read_amount(j, "liquidityTokens");
        return result;
    } catch (const json::exception& e) {
        throw ValidationError(std::string("malformed migrate response: ") + e.what());
    }
}

} // namespace launchpad::codec
