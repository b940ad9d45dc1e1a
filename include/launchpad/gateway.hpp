#ifndef LAUNCHPAD_GATEWAY_HPP
#define LAUNCHPAD_GATEWAY_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "access.hpp"
#include "chain_client.hpp"
#include "registry.hpp"
#include "types.hpp"

namespace launchpad {

// =============================================================================
// DestinationGateway - destination-side deployToken/syncPrice/migrateToDEX
// =============================================================================
//
// Each call checks the caller against the allow-list before touching state.

struct GatewayToken {
    DeployRequest request;
    DeployedAddresses addresses;
    bool migrated;
    Address liquidity_pair;
};

class DestinationGateway {
public:
    DestinationGateway(ChainId chain_id, std::shared_ptr<AllowList> allow_list);

    DestinationGateway(const DestinationGateway&) = delete;
    DestinationGateway& operator=(const DestinationGateway&) = delete;

    ChainId chain_id() const { return chain_id_; }

    // StateError(ALREADY_DEPLOYED) when the launch exists on this chain
    DeployedAddresses deploy_token(const Address& caller, const DeployRequest& request);

    // Returns false when seq is stale and the sync was dropped
    bool sync_price(const Address& caller, const PriceSync& sync);

    // StateError(ALREADY_MIGRATED) once terminal
    DexMigrationResult migrate_to_dex(const Address& caller, LaunchId launch_id);

    std::optional<GatewayToken> token(LaunchId launch_id) const;
    std::optional<SyncCursor> cursor(LaunchId launch_id) const;

    struct Stats {
        uint64_t deployments;
        uint64_t syncs_applied;
        uint64_t syncs_dropped;
        uint64_t migrations;
        uint64_t rejected_callers;
    };
    Stats get_stats() const;

private:
    ChainId chain_id_;
    std::shared_ptr<AllowList> allow_list_;

    std::map<LaunchId, GatewayToken> tokens_;
    mutable std::mutex tokens_mutex_;
    SyncLedger cursors_;

    std::atomic<uint64_t> deployments_{0};
    std::atomic<uint64_t> syncs_applied_{0};
    std::atomic<uint64_t> syncs_dropped_{0};
    std::atomic<uint64_t> migrations_{0};
    std::atomic<uint64_t> rejected_callers_{0};

    void check_caller(const Address& caller);
};

// =============================================================================
// LocalChainClient - ChainClient over an in-process gateway
// =============================================================================

class LocalChainClient : public ChainClient {
public:
    explicit LocalChainClient(std::shared_ptr<DestinationGateway> gateway);

    ChainId chain_id() const override { return gateway_->chain_id(); }
    DeployedAddresses deploy_token(const Address& caller, const DeployRequest& request) override;
    void sync_price(const Address& caller, const PriceSync& sync) override;
    DexMigrationResult migrate_to_dex(const Address& caller, LaunchId launch_id) override;

    const std::shared_ptr<DestinationGateway>& gateway() const { return gateway_; }

private:
    std::shared_ptr<DestinationGateway> gateway_;
};

} // namespace launchpad

#endif // LAUNCHPAD_GATEWAY_HPP
