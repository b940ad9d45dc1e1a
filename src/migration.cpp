// =============================================================================
// migration.cpp - Curve lifecycle: Active -> MigrationTriggered -> Migrated
// =============================================================================

#include "launchpad/migration.hpp"
#include "launchpad/errors.hpp"
#include "launchpad/math.hpp"
#include <algorithm>
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

std::string describe_key(const CurveKey& key) {
    return "launch " + std::to_string(key.launch_id) + " on chain " + std::to_string(key.chain_id);
}

} // anonymous namespace

const char* to_string(MigrationStatus status) {
    switch (status) {
        case MigrationStatus::Active: return "active";
        case MigrationStatus::MigrationTriggered: return "migration_triggered";
        case MigrationStatus::Migrated: return "migrated";
    }
    return "unknown";
}

// =============================================================================
// Constructor / Helpers
// =============================================================================

MigrationStateMachine::MigrationStateMachine(CurveParams params)
    : params_(std::move(params)) {}

MigrationStateMachine::Entry* MigrationStateMachine::find(const CurveKey& key) const {
    std::shared_lock lock(entries_mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() ? it->second.get() : nullptr;
}

MigrationStateMachine::Entry& MigrationStateMachine::require(const CurveKey& key) const {
    Entry* entry = find(key);
    if (!entry) {
        throw ValidationError("no curve registered for " + describe_key(key), errors::NOT_FOUND);
    }
    return *entry;
}

void MigrationStateMachine::check_tradable(const CurveKey& key, const Entry& entry,
                                           uint64_t seq) const {
    if (entry.migration.status != MigrationStatus::Active) {
        throw StateError(errors::CURVE_MIGRATED, "curve migrated for " + describe_key(key));
    }
    if (seq != 0 && seq <= entry.state.last_update_seq) {
        throw ConsistencyError("stale trade seq " + std::to_string(seq) + " for " +
                               describe_key(key) + " (last " +
                               std::to_string(entry.state.last_update_seq) + ")");
    }
    if (entry.paused) {
        throw StateError(errors::CURVE_PAUSED, "curve paused for " + describe_key(key));
    }
}

void MigrationStateMachine::record_volume(U128 volume, U128 fee) {
    std::lock_guard lock(volume_mutex_);
    total_volume_eth_ += volume;
    total_fees_eth_ += fee;
}

// =============================================================================
// Registration
// =============================================================================

int32_t MigrationStateMachine::register_curve(const CurveKey& key) {
    return register_curve(key, CurveState::initial(params_));
}

int32_t MigrationStateMachine::register_curve(const CurveKey& key, const CurveState& initial) {
    if (initial.total_supply > supply::CURVE_SUPPLY) {
        throw ValidationError("initial supply exceeds curve supply", errors::INVALID_AMOUNT);
    }

    std::unique_lock lock(entries_mutex_);
    if (entries_.find(key) != entries_.end()) {
        return errors::ALREADY_REGISTERED;
    }

    auto entry = std::make_unique<Entry>();
    entry->state = initial;
    entries_.emplace(key, std::move(entry));
    return errors::OK;
}

size_t MigrationStateMachine::register_batch(const std::vector<CurveKey>& keys) {
    size_t created = 0;
    for (const auto& key : keys) {
        if (register_curve(key) == errors::OK) ++created;
    }
    return created;
}

bool MigrationStateMachine::has_curve(const CurveKey& key) const {
    return find(key) != nullptr;
}

// =============================================================================
// Trades
// =============================================================================

BuyResult MigrationStateMachine::buy(const CurveKey& key, U128 eth_in, U128 min_tokens_out,
                                     uint32_t max_slippage_bps, uint64_t seq) {
    Entry& entry = require(key);
    std::lock_guard lock(entry.mutex);

    check_tradable(key, entry, seq);

    // Pure transition first; nothing below throws once it succeeds
    BuyResult result = price_engine::apply_buy(entry.state, eth_in, min_tokens_out,
                                               max_slippage_bps, params_.platform_fee_bps);
    if (seq != 0) result.state.last_update_seq = seq;

    entry.state = result.state;
    if (result.migration_triggered) {
        entry.migration.status = MigrationStatus::MigrationTriggered;
        entry.migration.final_price = price_engine::current_price(entry.state);
        entry.migration.liquidity_eth = entry.state.virtual_eth;
        entry.migration.liquidity_tokens = supply::LIQUIDITY_RESERVE;
    }

    total_buys_.fetch_add(1, std::memory_order_relaxed);
    record_volume(result.eth_used, result.fees.total());
    return result;
}

SellResult MigrationStateMachine::sell(const CurveKey& key, U128 tokens_in, U128 min_eth_out,
                                       uint32_t max_slippage_bps, uint64_t seq) {
    Entry& entry = require(key);
    std::lock_guard lock(entry.mutex);

    check_tradable(key, entry, seq);

    SellResult result = price_engine::apply_sell(entry.state, tokens_in, min_eth_out,
                                                 max_slippage_bps, params_.platform_fee_bps);
    if (seq != 0) result.state.last_update_seq = seq;

    entry.state = result.state;

    total_sells_.fetch_add(1, std::memory_order_relaxed);
    record_volume(result.eth_from_curve, result.platform_fee);
    return result;
}

// =============================================================================
// Migration
// =============================================================================

MigrationRecord MigrationStateMachine::migrate(const CurveKey& key, LiquidityMigrator& migrator) {
    Entry& entry = require(key);

    MigrationRequest request{};
    {
        std::lock_guard lock(entry.mutex);
        if (entry.migration.status == MigrationStatus::Migrated || entry.migration_in_flight) {
            throw StateError(errors::ALREADY_MIGRATED, "already migrated: " + describe_key(key));
        }
        if (entry.migration.status == MigrationStatus::Active) {
            throw StateError(errors::MIGRATION_NOT_TRIGGERED,
                             "migration not triggered for " + describe_key(key));
        }

        request.key = key;
        request.final_price = price_engine::current_price(entry.state);
        request.liquidity_eth = entry.state.virtual_eth;
        request.liquidity_tokens = supply::LIQUIDITY_RESERVE;

        // Claim the migration before leaving the lock
        entry.migration_in_flight = true;
    }

    MigrationOutcome outcome;
    try {
        outcome = migrator.migrate(request);
    } catch (const std::exception&) {
        std::lock_guard lock(entry.mutex);
        entry.migration_in_flight = false;
        throw;
    }

    std::lock_guard lock(entry.mutex);
    entry.migration_in_flight = false;
    if (!outcome.success) {
        throw NetworkError("liquidity migration failed for " + describe_key(key) + ": " +
                           outcome.error);
    }

    entry.migration.status = MigrationStatus::Migrated;
    entry.migration.final_price = request.final_price;
    entry.migration.liquidity_eth = request.liquidity_eth;
    entry.migration.liquidity_tokens = request.liquidity_tokens;
    entry.migration.liquidity_pair = outcome.liquidity_pair;
    entry.migration.migrated_at = unix_time();

    total_migrations_.fetch_add(1, std::memory_order_relaxed);
    return entry.migration;
}

// =============================================================================
// Emergency Controls
// =============================================================================

int32_t MigrationStateMachine::pause(const CurveKey& key) {
    Entry* entry = find(key);
    if (!entry) return errors::NOT_FOUND;
    std::lock_guard lock(entry->mutex);
    entry->paused = true;
    return errors::OK;
}

int32_t MigrationStateMachine::unpause(const CurveKey& key) {
    Entry* entry = find(key);
    if (!entry) return errors::NOT_FOUND;
    std::lock_guard lock(entry->mutex);
    entry->paused = false;
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<CurveState> MigrationStateMachine::curve_state(const CurveKey& key) const {
    Entry* entry = find(key);
    if (!entry) return std::nullopt;
    std::lock_guard lock(entry->mutex);
    return entry->state;
}

std::optional<MigrationRecord> MigrationStateMachine::migration_record(const CurveKey& key) const {
    Entry* entry = find(key);
    if (!entry) return std::nullopt;
    std::lock_guard lock(entry->mutex);
    return entry->migration;
}

std::optional<CurveSnapshot> MigrationStateMachine::snapshot(const CurveKey& key) const {
    Entry* entry = find(key);
    if (!entry) return std::nullopt;
    std::lock_guard lock(entry->mutex);
    return CurveSnapshot{key, entry->state, entry->migration, entry->paused};
}

std::vector<CurveSnapshot> MigrationStateMachine::snapshots_for_launch(LaunchId launch_id) const {
    std::vector<std::pair<CurveKey, Entry*>> matches;
    {
        std::shared_lock lock(entries_mutex_);
        for (const auto& [key, entry] : entries_) {
            if (key.launch_id == launch_id) matches.emplace_back(key, entry.get());
        }
    }

    std::vector<CurveSnapshot> result;
    result.reserve(matches.size());
    for (const auto& [key, entry] : matches) {
        std::lock_guard lock(entry->mutex);
        result.push_back(CurveSnapshot{key, entry->state, entry->migration, entry->paused});
    }
    std::sort(result.begin(), result.end(), [](const CurveSnapshot& a, const CurveSnapshot& b) {
        return a.key < b.key;
    });
    return result;
}

MigrationStateMachine::Stats MigrationStateMachine::get_stats() const {
    Stats stats{};
    {
        std::shared_lock lock(entries_mutex_);
        stats.total_curves = entries_.size();
    }
    stats.total_buys = total_buys_.load(std::memory_order_relaxed);
    stats.total_sells = total_sells_.load(std::memory_order_relaxed);
    stats.total_migrations = total_migrations_.load(std::memory_order_relaxed);
    std::lock_guard lock(volume_mutex_);
    stats.total_volume_eth = total_volume_eth_;
    stats.total_fees_eth = total_fees_eth_;
    return stats;
}

} // namespace launchpad
