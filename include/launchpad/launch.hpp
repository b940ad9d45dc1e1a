#ifndef LAUNCHPAD_LAUNCH_HPP
#define LAUNCHPAD_LAUNCH_HPP

#include <map>
#include <set>
#include <shared_mutex>
#include <optional>
#include <vector>
#include <string>

#include "types.hpp"

namespace launchpad {

// =============================================================================
// Launch - identity of one token across all chains (immutable)
// =============================================================================

struct Launch {
    LaunchId launch_id;
    Address creator;
    std::string name;
    std::string symbol;
    ChainId origin_chain_id;
    std::set<ChainId> target_chain_ids;
    uint64_t created_at;

    // Origin first, then targets in ascending order, without duplicates
    std::vector<ChainId> all_chains() const;
};

constexpr size_t MAX_NAME_LENGTH = 32;
constexpr size_t MAX_SYMBOL_LENGTH = 10;

// 64-bit FNV-1a over creator bytes, nonce and timestamp (big-endian)
LaunchId compute_launch_id(const Address& creator, uint64_t nonce, uint64_t timestamp);

// Deterministic, clock-free CREATE2-style salt for one deployment
uint64_t deployment_salt(LaunchId launch_id, ChainId chain_id);

// Addresses a deployment with `salt` is expected to land at
Address predict_token_address(uint64_t salt);
Address predict_curve_address(uint64_t salt);
Address predict_pair_address(uint64_t salt);

// Throws ValidationError on an empty or oversized name/symbol, a zero
// creator or an empty target set
void validate_launch(const Launch& launch);

// =============================================================================
// LaunchRegistry - launches keyed by content-derived id
// =============================================================================

class LaunchRegistry {
public:
    LaunchRegistry() = default;

    LaunchRegistry(const LaunchRegistry&) = delete;
    LaunchRegistry& operator=(const LaunchRegistry&) = delete;

    // Validates, then inserts. ALREADY_REGISTERED leaves the first record as is.
    int32_t register_launch(const Launch& launch);

    std::optional<Launch> get(LaunchId launch_id) const;
    bool contains(LaunchId launch_id) const;
    std::vector<Launch> launches() const;

    // Empty when the launch is unknown
    std::vector<ChainId> chains_for(LaunchId launch_id) const;

    size_t size() const;

private:
    std::map<LaunchId, Launch> launches_;
    mutable std::shared_mutex mutex_;
};

} // namespace launchpad

#endif // LAUNCHPAD_LAUNCH_HPP
