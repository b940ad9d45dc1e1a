#ifndef LAUNCHPAD_EVENTS_HPP
#define LAUNCHPAD_EVENTS_HPP

#include <string>
#include <variant>
#include <vector>

#include "types.hpp"

namespace launchpad {

// =============================================================================
// Chain Events (emitted by origin/per-chain contracts)
// =============================================================================

struct TokenCreated {
    LaunchId launch_id;
    std::string name;
    std::string symbol;
    Address creator;
    ChainId origin_chain_id;
    std::vector<ChainId> target_chain_ids;
    uint64_t timestamp = 0;          // block time, 0 when unknown
};

struct TokenPurchase {
    LaunchId launch_id;
    Address buyer;
    U128 eth_in;
    U128 tokens_out;
    U128 price;
    uint64_t seq;
};

struct TokenSale {
    LaunchId launch_id;
    Address seller;
    U128 tokens_in;
    U128 eth_out;
    U128 price;
    uint64_t seq;
};

struct CurveMigrationTriggered {
    LaunchId launch_id;
    U128 final_price;
    U128 liquidity_eth;
    U128 liquidity_tokens;
};

using EventPayload = std::variant<TokenCreated, TokenPurchase, TokenSale, CurveMigrationTriggered>;

// Envelope: every event names the chain it came from and the relayer that
// delivered it
struct ChainEvent {
    ChainId chain_id;
    Address caller;
    EventPayload payload;

    LaunchId launch_id() const;
    const char* type_name() const;
};

} // namespace launchpad

#endif // LAUNCHPAD_EVENTS_HPP
