#include "launchpad/gateway.hpp"
#include "launchpad/errors.hpp"
#include "launchpad/launch.hpp"
#include <chrono>

namespace launchpad {

namespace {

uint64_t unix_time() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // anonymous namespace

DestinationGateway::DestinationGateway(ChainId chain_id, std::shared_ptr<AllowList> allow_list)
    : chain_id_(chain_id), allow_list_(std::move(allow_list)) {
    if (!allow_list_) {
        throw ValidationError("gateway requires an allow-list");
    }
}

void DestinationGateway::check_caller(const Address& caller) {
    if (!allow_list_->is_authorized(caller)) {
        rejected_callers_.fetch_add(1, std::memory_order_relaxed);
        throw AuthorizationError("chain " + std::to_string(chain_id_) +
                                 " rejected caller " + to_hex(caller));
    }
}

DeployedAddresses DestinationGateway::deploy_token(const Address& caller,
                                                   const DeployRequest& request) {
    check_caller(caller);
    if (request.name.empty() || request.symbol.empty()) {
        throw ValidationError("deploy request needs a name and a symbol");
    }
    if (is_zero_address(request.creator)) {
        throw ValidationError("deploy request creator is the zero address", errors::ZERO_ADDRESS);
    }

    std::lock_guard lock(tokens_mutex_);
    if (tokens_.count(request.launch_id) > 0) {
        throw StateError(errors::ALREADY_DEPLOYED,
                         "launch " + std::to_string(request.launch_id) +
                         " already deployed on chain " + std::to_string(chain_id_));
    }

    DeployedAddresses addresses{predict_token_address(request.salt),
                                predict_curve_address(request.salt)};
    tokens_.emplace(request.launch_id, GatewayToken{request, addresses, false, Address{}});
    deployments_.fetch_add(1, std::memory_order_relaxed);
    return addresses;
}

bool DestinationGateway::sync_price(const Address& caller, const PriceSync& sync) {
    check_caller(caller);
    {
        std::lock_guard lock(tokens_mutex_);
        if (tokens_.count(sync.launch_id) == 0) {
            throw ValidationError("launch " + std::to_string(sync.launch_id) +
                                  " not deployed on chain " + std::to_string(chain_id_),
                                  errors::NOT_FOUND);
        }
    }

    CurveKey key{sync.launch_id, chain_id_};
    if (!cursors_.try_advance(key, sync.seq, unix_time(), sync.price, sync.total_supply)) {
        syncs_dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    syncs_applied_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

DexMigrationResult DestinationGateway::migrate_to_dex(const Address& caller, LaunchId launch_id) {
    check_caller(caller);

    std::lock_guard lock(tokens_mutex_);
    auto it = tokens_.find(launch_id);
    if (it == tokens_.end()) {
        throw ValidationError("launch " + std::to_string(launch_id) +
                              " not deployed on chain " + std::to_string(chain_id_),
                              errors::NOT_FOUND);
    }
    if (it->second.migrated) {
        throw StateError(errors::ALREADY_MIGRATED,
                         "launch " + std::to_string(launch_id) +
                         " already migrated on chain " + std::to_string(chain_id_));
    }

    it->second.migrated = true;
    it->second.liquidity_pair = predict_pair_address(it->second.request.salt);
    migrations_.fetch_add(1, std::memory_order_relaxed);

    DexMigrationResult result{};
    result.liquidity_pair = it->second.liquidity_pair;
    result.liquidity_tokens = supply::LIQUIDITY_RESERVE;
    if (auto c = cursors_.cursor(CurveKey{launch_id, chain_id_})) {
        result.final_price = c->last_price;
    }
    return result;
}

std::optional<GatewayToken> DestinationGateway::token(LaunchId launch_id) const {
    std::lock_guard lock(tokens_mutex_);
    auto it = tokens_.find(launch_id);
    if (it == tokens_.end()) return std::nullopt;
    return it->second;
}

std::optional<SyncCursor> DestinationGateway::cursor(LaunchId launch_id) const {
    return cursors_.cursor(CurveKey{launch_id, chain_id_});
}

DestinationGateway::Stats DestinationGateway::get_stats() const {
    return Stats{
        deployments_.load(std::memory_order_relaxed),
        syncs_applied_.load(std::memory_order_relaxed),
        syncs_dropped_.load(std::memory_order_relaxed),
        migrations_.load(std::memory_order_relaxed),
        rejected_callers_.load(std::memory_order_relaxed)
    };
}

// =============================================================================
// LocalChainClient
// =============================================================================

LocalChainClient::LocalChainClient(std::shared_ptr<DestinationGateway> gateway)
    : gateway_(std::move(gateway)) {
    if (!gateway_) {
        throw ValidationError("local chain client requires a gateway");
    }
}

DeployedAddresses LocalChainClient::deploy_token(const Address& caller,
                                                 const DeployRequest& request) {
    return gateway_->deploy_token(caller, request);
}

void LocalChainClient::sync_price(const Address& caller, const PriceSync& sync) {
    gateway_->sync_price(caller, sync);
}

DexMigrationResult LocalChainClient::migrate_to_dex(const Address& caller, LaunchId launch_id) {
    return gateway_->migrate_to_dex(caller, launch_id);
}

} // namespace launchpad
