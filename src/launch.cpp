#include "launchpad/launch.hpp"
#include "launchpad/errors.hpp"
#include <mutex>

namespace launchpad {

namespace {

constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

void fnv_byte(uint64_t& h, uint8_t b) {
    h ^= b;
    h *= FNV_PRIME;
}

void fnv_u64(uint64_t& h, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        fnv_byte(h, static_cast<uint8_t>(v >> shift));
    }
}

// Fills 20 bytes from three hash lanes seeded by (salt, role, lane)
Address derive_address(uint64_t salt, uint8_t role) {
    Address addr{};
    size_t pos = 0;
    for (uint8_t lane = 0; pos < addr.size(); ++lane) {
        uint64_t h = FNV_OFFSET;
        fnv_byte(h, role);
        fnv_byte(h, lane);
        fnv_u64(h, salt);
        for (int shift = 56; shift >= 0 && pos < addr.size(); shift -= 8) {
            addr[pos++] = static_cast<uint8_t>(h >> shift);
        }
    }
    return addr;
}

} // anonymous namespace

std::vector<ChainId> Launch::all_chains() const {
    std::vector<ChainId> chains;
    chains.reserve(target_chain_ids.size() + 1);
    chains.push_back(origin_chain_id);
    for (ChainId chain : target_chain_ids) {
        if (chain != origin_chain_id) chains.push_back(chain);
    }
    return chains;
}

LaunchId compute_launch_id(const Address& creator, uint64_t nonce, uint64_t timestamp) {
    uint64_t h = FNV_OFFSET;
    for (uint8_t b : creator) fnv_byte(h, b);
    fnv_u64(h, nonce);
    fnv_u64(h, timestamp);
    return h;
}

uint64_t deployment_salt(LaunchId launch_id, ChainId chain_id) {
    uint64_t h = FNV_OFFSET;
    fnv_u64(h, launch_id);
    fnv_u64(h, chain_id);
    return h;
}

Address predict_token_address(uint64_t salt) {
    return derive_address(salt, 0x01);
}

Address predict_curve_address(uint64_t salt) {
    return derive_address(salt, 0x02);
}

Address predict_pair_address(uint64_t salt) {
    return derive_address(salt, 0x03);
}

void validate_launch(const Launch& launch) {
    if (launch.name.empty() || launch.name.size() > MAX_NAME_LENGTH) {
        throw ValidationError("name must be 1-" + std::to_string(MAX_NAME_LENGTH) + " bytes");
    }
    if (launch.symbol.empty() || launch.symbol.size() > MAX_SYMBOL_LENGTH) {
        throw ValidationError("symbol must be 1-" + std::to_string(MAX_SYMBOL_LENGTH) + " bytes");
    }
    if (is_zero_address(launch.creator)) {
        throw ValidationError("creator is the zero address", errors::ZERO_ADDRESS);
    }
    if (launch.target_chain_ids.empty()) {
        throw ValidationError("launch has no target chains", errors::UNSUPPORTED_CHAIN);
    }
}

// =============================================================================
// LaunchRegistry
// =============================================================================

int32_t LaunchRegistry::register_launch(const Launch& launch) {
    validate_launch(launch);

    std::unique_lock lock(mutex_);
    auto [it, inserted] = launches_.emplace(launch.launch_id, launch);
    return inserted ? errors::OK : errors::ALREADY_REGISTERED;
}

std::optional<Launch> LaunchRegistry::get(LaunchId launch_id) const {
    std::shared_lock lock(mutex_);
    auto it = launches_.find(launch_id);
    if (it == launches_.end()) return std::nullopt;
    return it->second;
}

bool LaunchRegistry::contains(LaunchId launch_id) const {
    std::shared_lock lock(mutex_);
    return launches_.count(launch_id) > 0;
}

std::vector<Launch> LaunchRegistry::launches() const {
    std::shared_lock lock(mutex_);
    std::vector<Launch> result;
    result.reserve(launches_.size());
    for (const auto& [id, launch] : launches_) result.push_back(launch);
    return result;
}

std::vector<ChainId> LaunchRegistry::chains_for(LaunchId launch_id) const {
    std::shared_lock lock(mutex_);
    auto it = launches_.find(launch_id);
    if (it == launches_.end()) return {};
    return it->second.all_chains();
}

size_t LaunchRegistry::size() const {
    std::shared_lock lock(mutex_);
    return launches_.size();
}

} // namespace launchpad
