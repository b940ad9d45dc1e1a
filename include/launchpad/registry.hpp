#ifndef LAUNCHPAD_REGISTRY_HPP
#define LAUNCHPAD_REGISTRY_HPP

#include <memory>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <optional>
#include <vector>
#include <functional>
#include <string>

#include "types.hpp"

namespace launchpad {

// =============================================================================
// Deployment Record
// =============================================================================

enum class DeploymentStatus : uint8_t {
    Pending = 0,
    Deployed = 1,
    Failed = 2
};

const char* to_string(DeploymentStatus status);

struct DeployedAddresses {
    Address token_address;
    Address curve_address;
};

struct DeploymentRecord {
    CurveKey key;
    Address token_address;
    Address curve_address;
    uint64_t salt;
    uint64_t deployed_at;
    DeploymentStatus status;
    uint32_t attempts;
    std::string last_error;
};

struct DeployOutcome {
    DeploymentRecord record;
    bool created;              // false when an existing record was returned
};

// =============================================================================
// DeploymentRegistry - at most one deployment per (launch, chain)
// =============================================================================

class DeploymentRegistry {
public:
    using DeployFn = std::function<DeployedAddresses()>;

    DeploymentRegistry() = default;

    DeploymentRegistry(const DeploymentRegistry&) = delete;
    DeploymentRegistry& operator=(const DeploymentRegistry&) = delete;

    // Compare-and-set. A Deployed record is returned unchanged without calling
    // `deploy`. Otherwise `deploy` runs under the key's lock; an exception
    // leaves a Failed record (retried by the next call) and propagates.
    DeployOutcome try_deploy(const CurveKey& key, uint64_t salt, const DeployFn& deploy);

    // Bulk pre-load of already deployed pairs; existing keys are untouched.
    // Returns the number of records inserted.
    size_t register_batch(const std::vector<DeploymentRecord>& records);

    std::optional<DeploymentRecord> get(const CurveKey& key) const;
    bool is_deployed(const CurveKey& key) const;
    std::vector<DeploymentRecord> records_for_launch(LaunchId launch_id) const;
    size_t size() const;

private:
    struct Slot {
        std::mutex mutex;
        std::optional<DeploymentRecord> record;
    };

    std::unordered_map<CurveKey, std::unique_ptr<Slot>, CurveKeyHash> slots_;
    mutable std::shared_mutex slots_mutex_;

    Slot& slot(const CurveKey& key);
    Slot* find(const CurveKey& key) const;
};

// =============================================================================
// Sync Cursor
// =============================================================================

struct SyncCursor {
    uint64_t last_applied_seq;
    uint64_t last_applied_timestamp;
    U128 last_price;
    U128 last_total_supply;
};

// =============================================================================
// SyncLedger - high-water mark per (launch, chain)
// =============================================================================

class SyncLedger {
public:
    SyncLedger() = default;

    SyncLedger(const SyncLedger&) = delete;
    SyncLedger& operator=(const SyncLedger&) = delete;

    // Applies the update only when seq > last_applied_seq. Returns whether it
    // was applied; a stale or duplicate seq leaves the cursor untouched.
    bool try_advance(const CurveKey& key, uint64_t seq, uint64_t timestamp,
                     U128 price = 0, U128 total_supply = 0);

    bool is_fresh(const CurveKey& key, uint64_t seq) const;

    std::optional<SyncCursor> cursor(const CurveKey& key) const;

    // Creates zeroed cursors; returns the number newly created
    size_t register_batch(const std::vector<CurveKey>& keys);

    size_t size() const;

private:
    struct Slot {
        mutable std::mutex mutex;
        SyncCursor cursor{};
    };

    std::unordered_map<CurveKey, std::unique_ptr<Slot>, CurveKeyHash> slots_;
    mutable std::shared_mutex slots_mutex_;

    Slot& slot(const CurveKey& key);
    Slot* find(const CurveKey& key) const;
};

} // namespace launchpad

#endif // LAUNCHPAD_REGISTRY_HPP
