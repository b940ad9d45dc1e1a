#ifndef LAUNCHPAD_MIGRATION_HPP
#define LAUNCHPAD_MIGRATION_HPP

#include <memory>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <optional>
#include <vector>
#include <atomic>
#include <string>

#include "types.hpp"
#include "curve.hpp"

namespace launchpad {

// =============================================================================
// Migration Record
// =============================================================================

enum class MigrationStatus : uint8_t {
    Active = 0,
    MigrationTriggered = 1,
    Migrated = 2          // terminal
};

const char* to_string(MigrationStatus status);

struct MigrationRecord {
    MigrationStatus status = MigrationStatus::Active;
    U128 final_price = 0;
    U128 liquidity_eth = 0;
    U128 liquidity_tokens = 0;
    uint64_t migrated_at = 0;
    Address liquidity_pair{};
};

// =============================================================================
// Liquidity Migrator (external DEX integration)
// =============================================================================

struct MigrationRequest {
    CurveKey key;
    U128 final_price;
    U128 liquidity_eth;
    U128 liquidity_tokens;
};

// Result value; a failure is retryable and never swallowed
struct MigrationOutcome {
    bool success;
    Address liquidity_pair;
    std::string error;

    static MigrationOutcome ok(const Address& pair) { return {true, pair, {}}; }
    static MigrationOutcome failure(std::string error) { return {false, Address{}, std::move(error)}; }
};

class LiquidityMigrator {
public:
    virtual ~LiquidityMigrator() = default;
    virtual MigrationOutcome migrate(const MigrationRequest& request) = 0;
};

// =============================================================================
// Curve Snapshot (committed state of one key)
// =============================================================================

struct CurveSnapshot {
    CurveKey key;
    CurveState state;
    MigrationRecord migration;
    bool paused;
};

// =============================================================================
// MigrationStateMachine - Active -> MigrationTriggered -> Migrated per curve
// =============================================================================
//
// Owns the curve_states and migrations tables. Every mutation of a key runs
// under that key's mutex; different keys proceed in parallel.

class MigrationStateMachine {
public:
    explicit MigrationStateMachine(CurveParams params = {});
    ~MigrationStateMachine() = default;

    // Non-copyable
    MigrationStateMachine(const MigrationStateMachine&) = delete;
    MigrationStateMachine& operator=(const MigrationStateMachine&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    // Returns OK, or ALREADY_REGISTERED leaving the existing curve untouched
    int32_t register_curve(const CurveKey& key);
    int32_t register_curve(const CurveKey& key, const CurveState& initial);

    // Bulk pre-load; returns the number of keys newly registered
    size_t register_batch(const std::vector<CurveKey>& keys);

    bool has_curve(const CurveKey& key) const;

    // =========================================================================
    // Trades
    // =========================================================================

    // seq == 0 bypasses the sequence gate (direct calls); otherwise a seq at or
    // below the curve's last_update_seq throws ConsistencyError untouched.
    BuyResult buy(const CurveKey& key, U128 eth_in, U128 min_tokens_out,
                  uint32_t max_slippage_bps, uint64_t seq = 0);

    SellResult sell(const CurveKey& key, U128 tokens_in, U128 min_eth_out,
                    uint32_t max_slippage_bps, uint64_t seq = 0);

    // =========================================================================
    // Migration
    // =========================================================================

    // Completes a triggered migration through `migrator`.
    // Throws StateError(ALREADY_MIGRATED) when terminal or another attempt is in
    // flight, StateError(MIGRATION_NOT_TRIGGERED) while Active, and
    // NetworkError when the migrator reports failure (status stays triggered).
    MigrationRecord migrate(const CurveKey& key, LiquidityMigrator& migrator);

    // =========================================================================
    // Emergency Controls
    // =========================================================================

    int32_t pause(const CurveKey& key);
    int32_t unpause(const CurveKey& key);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<CurveState> curve_state(const CurveKey& key) const;
    std::optional<MigrationRecord> migration_record(const CurveKey& key) const;
    std::optional<CurveSnapshot> snapshot(const CurveKey& key) const;

    // Committed snapshots of every chain of a launch, read one key at a time
    std::vector<CurveSnapshot> snapshots_for_launch(LaunchId launch_id) const;

    const CurveParams& params() const { return params_; }

    struct Stats {
        uint64_t total_curves;
        uint64_t total_buys;
        uint64_t total_sells;
        uint64_t total_migrations;
        U128 total_volume_eth;
        U128 total_fees_eth;
    };
    Stats get_stats() const;

private:
    struct Entry {
        mutable std::mutex mutex;
        CurveState state;
        MigrationRecord migration;
        bool paused = false;
        bool migration_in_flight = false;
    };

    CurveParams params_;

    // Entries are never erased, so raw pointers stay valid after the map lock
    std::unordered_map<CurveKey, std::unique_ptr<Entry>, CurveKeyHash> entries_;
    mutable std::shared_mutex entries_mutex_;

    std::atomic<uint64_t> total_buys_{0};
    std::atomic<uint64_t> total_sells_{0};
    std::atomic<uint64_t> total_migrations_{0};
    mutable std::mutex volume_mutex_;
    U128 total_volume_eth_ = 0;
    U128 total_fees_eth_ = 0;

    Entry* find(const CurveKey& key) const;
    Entry& require(const CurveKey& key) const;
    void check_tradable(const CurveKey& key, const Entry& entry, uint64_t seq) const;
    void record_volume(U128 volume, U128 fee);
};

} // namespace launchpad

#endif // LAUNCHPAD_MIGRATION_HPP
