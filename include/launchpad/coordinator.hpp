#ifndef LAUNCHPAD_COORDINATOR_HPP
#define LAUNCHPAD_COORDINATOR_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "access.hpp"
#include "chain_client.hpp"
#include "config.hpp"
#include "dead_letter.hpp"
#include "events.hpp"
#include "launch.hpp"
#include "migration.hpp"
#include "registry.hpp"

namespace launchpad {

// =============================================================================
// Handle Result
// =============================================================================

// success is true for applied events and for harmless no-ops (duplicates,
// stale sequence numbers); code then tells which of the two it was
struct HandleResult {
    bool success;
    int32_t code;
    std::string error;
    uint32_t legs_dispatched;
    uint32_t legs_failed;

    static HandleResult ok(int32_t code = 0, std::string note = {}) {
        return {true, code, std::move(note), 0, 0};
    }
    static HandleResult failure(int32_t code, std::string error) {
        return {false, code, std::move(error), 0, 0};
    }
};

// =============================================================================
// Price Report
// =============================================================================

struct ChainPrice {
    ChainId chain_id;
    U128 price;
    U128 total_supply;
    int32_t deviation_bps;     // signed, relative to the unified price
};

struct PriceReport {
    LaunchId launch_id;
    U128 unified_price;
    U128 total_supply;
    std::vector<ChainPrice> chains;
    uint32_t max_deviation_bps;
    bool needs_rebalance;
};

// =============================================================================
// CrossChainCoordinator
// =============================================================================
//
// Consumes one EventSource per chain and keeps every chain of a launch
// consistent: creation fans out deployments, trades propagate a unified price,
// a filled curve migrates on its own chain. Fan-out legs run concurrently; a
// leg that exhausts its retries is dead-lettered while the others proceed.

class CrossChainCoordinator {
public:
    CrossChainCoordinator(CoordinatorConfig config, std::shared_ptr<AllowList> allow_list);
    ~CrossChainCoordinator();

    CrossChainCoordinator(const CrossChainCoordinator&) = delete;
    CrossChainCoordinator& operator=(const CrossChainCoordinator&) = delete;

    // =========================================================================
    // Wiring
    // =========================================================================

    void add_chain(std::shared_ptr<ChainClient> client);
    void add_event_source(std::shared_ptr<EventSource> source);
    bool has_chain(ChainId chain_id) const;

    // =========================================================================
    // Lifecycle (one worker per event source)
    // =========================================================================

    bool start();
    void stop();

    // Blocks until every worker has drained its closed source, then stops
    void join();
    bool is_running() const { return running_.load(); }

    // =========================================================================
    // Event Handling
    // =========================================================================

    // Never throws for a LaunchpadError raised while handling the event
    HandleResult handle(const ChainEvent& event);

    // =========================================================================
    // Aggregation
    // =========================================================================

    // Price of the summed reserves of every chain of the launch
    std::optional<U128> unified_price(LaunchId launch_id) const;
    std::optional<PriceReport> price_report(LaunchId launch_id) const;

    // =========================================================================
    // Operations
    // =========================================================================

    // Re-runs parked legs through the idempotent paths; returns how many
    // completed. Legs that fail again are parked anew.
    size_t redispatch_dead_letters();

    // Admin-only emergency controls
    HandleResult pause(const Address& caller, const CurveKey& key);
    HandleResult unpause(const Address& caller, const CurveKey& key);

    // =========================================================================
    // Accessors
    // =========================================================================

    const CoordinatorConfig& config() const { return config_; }
    const MigrationStateMachine& curves() const { return curves_; }
    const DeploymentRegistry& deployments() const { return deployments_; }
    const SyncLedger& sync_ledger() const { return sync_ledger_; }
    const LaunchRegistry& launches() const { return launches_; }
    const DeadLetterQueue& dead_letters() const { return dead_letters_; }
    AllowList& allow_list() { return *allow_list_; }

    struct Stats {
        uint64_t events_handled;
        uint64_t events_rejected;
        uint64_t events_discarded;
        uint64_t deployments;
        uint64_t syncs_sent;
        uint64_t migrations;
        uint64_t dead_lettered;
        uint64_t source_errors;     // bad replies from an EventSource
    };
    Stats get_stats() const;

private:
    CoordinatorConfig config_;
    std::shared_ptr<AllowList> allow_list_;

    LaunchRegistry launches_;
    MigrationStateMachine curves_;
    DeploymentRegistry deployments_;
    SyncLedger sync_ledger_;
    DeadLetterQueue dead_letters_;

    std::map<ChainId, std::shared_ptr<ChainClient>> clients_;
    mutable std::shared_mutex clients_mutex_;

    std::vector<std::shared_ptr<EventSource>> sources_;
    std::vector<std::thread> workers_;
    std::mutex workers_mutex_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> events_handled_{0};
    std::atomic<uint64_t> events_rejected_{0};
    std::atomic<uint64_t> events_discarded_{0};
    std::atomic<uint64_t> deployments_made_{0};
    std::atomic<uint64_t> syncs_sent_{0};
    std::atomic<uint64_t> migrations_{0};
    std::atomic<uint64_t> source_errors_{0};

    void worker_loop(std::shared_ptr<EventSource> source);

    HandleResult on_created(const ChainEvent& event, const TokenCreated& created);
    HandleResult on_purchase(const ChainEvent& event, const TokenPurchase& purchase);
    HandleResult on_sale(const ChainEvent& event, const TokenSale& sale);
    HandleResult on_migration(const ChainEvent& event, const CurveMigrationTriggered& triggered);

    // Fan-out to every deployed chain of the launch except `source_chain`
    HandleResult propagate_price(const Launch& launch, ChainId source_chain);

    // Legs return true when the leg completed (or was a harmless no-op)
    bool deploy_leg(const DeployRequest& request, ChainId chain_id);
    bool sync_leg(const CurveKey& key, const PriceSync& sync);
    bool migrate_leg(const CurveKey& key);

    std::shared_ptr<ChainClient> client_for(ChainId chain_id) const;
    Launch require_launch(LaunchId launch_id) const;
};

} // namespace launchpad

#endif // LAUNCHPAD_COORDINATOR_HPP
