// =============================================================================
// registry.cpp - Idempotent keyed stores: deployments and sync cursors
// =============================================================================

#include "launchpad/registry.hpp"
#include <algorithm>
#include <chrono>
#include <exception>

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

const char* to_string(DeploymentStatus status) {
    switch (status) {
        case DeploymentStatus::Pending: return "pending";
        case DeploymentStatus::Deployed: return "deployed";
        case DeploymentStatus::Failed: return "failed";
    }
    return "unknown";
}

// =============================================================================
// DeploymentRegistry
// =============================================================================

DeploymentRegistry::Slot& DeploymentRegistry::slot(const CurveKey& key) {
    {
        std::shared_lock lock(slots_mutex_);
        auto it = slots_.find(key);
        if (it != slots_.end()) return *it->second;
    }
    std::unique_lock lock(slots_mutex_);
    auto& entry = slots_[key];
    if (!entry) entry = std::make_unique<Slot>();
    return *entry;
}

DeploymentRegistry::Slot* DeploymentRegistry::find(const CurveKey& key) const {
    std::shared_lock lock(slots_mutex_);
    auto it = slots_.find(key);
    return it != slots_.end() ? it->second.get() : nullptr;
}

DeployOutcome DeploymentRegistry::try_deploy(const CurveKey& key, uint64_t salt,
                                             const DeployFn& deploy) {
    Slot& s = slot(key);
    std::lock_guard lock(s.mutex);

    if (s.record && s.record->status == DeploymentStatus::Deployed) {
        return {*s.record, false};
    }

    if (!s.record) {
        s.record = DeploymentRecord{key, Address{}, Address{}, salt, 0,
                                    DeploymentStatus::Pending, 0, {}};
    }
    s.record->status = DeploymentStatus::Pending;
    s.record->salt = salt;
    s.record->attempts++;

    DeployedAddresses addresses;
    try {
        addresses = deploy();
    } catch (const std::exception& e) {
        s.record->status = DeploymentStatus::Failed;
        s.record->last_error = e.what();
        throw;
    }

    s.record->token_address = addresses.token_address;
    s.record->curve_address = addresses.curve_address;
    s.record->deployed_at = unix_time();
    s.record->status = DeploymentStatus::Deployed;
    s.record->last_error.clear();
    return {*s.record, true};
}

size_t DeploymentRegistry::register_batch(const std::vector<DeploymentRecord>& records) {
    size_t inserted = 0;
    for (const auto& record : records) {
        Slot& s = slot(record.key);
        std::lock_guard lock(s.mutex);
        if (s.record) continue;
        s.record = record;
        ++inserted;
    }
    return inserted;
}

std::optional<DeploymentRecord> DeploymentRegistry::get(const CurveKey& key) const {
    Slot* s = find(key);
    if (!s) return std::nullopt;
    std::lock_guard lock(s->mutex);
    return s->record;
}

bool DeploymentRegistry::is_deployed(const CurveKey& key) const {
    auto record = get(key);
    return record && record->status == DeploymentStatus::Deployed;
}

std::vector<DeploymentRecord> DeploymentRegistry::records_for_launch(LaunchId launch_id) const {
    std::vector<Slot*> matches;
    {
        std::shared_lock lock(slots_mutex_);
        for (const auto& [key, s] : slots_) {
            if (key.launch_id == launch_id) matches.push_back(s.get());
        }
    }

    std::vector<DeploymentRecord> result;
    for (Slot* s : matches) {
        std::lock_guard lock(s->mutex);
        if (s->record) result.push_back(*s->record);
    }
    std::sort(result.begin(), result.end(), [](const DeploymentRecord& a, const DeploymentRecord& b) {
        return a.key < b.key;
    });
    return result;
}

size_t DeploymentRegistry::size() const {
    std::shared_lock lock(slots_mutex_);
    return slots_.size();
}

// =============================================================================
// SyncLedger
// =============================================================================

SyncLedger::Slot& SyncLedger::slot(const CurveKey& key) {
    {
        std::shared_lock lock(slots_mutex_);
        auto it = slots_.find(key);
        if (it != slots_.end()) return *it->second;
    }
    std::unique_lock lock(slots_mutex_);
    auto& entry = slots_[key];
    if (!entry) entry = std::make_unique<Slot>();
    return *entry;
}

SyncLedger::Slot* SyncLedger::find(const CurveKey& key) const {
    std::shared_lock lock(slots_mutex_);
    auto it = slots_.find(key);
    return it != slots_.end() ? it->second.get() : nullptr;
}

bool SyncLedger::try_advance(const CurveKey& key, uint64_t seq, uint64_t timestamp,
                             U128 price, U128 total_supply) {
    Slot& s = slot(key);
    std::lock_guard lock(s.mutex);
    if (seq <= s.cursor.last_applied_seq) return false;

    s.cursor.last_applied_seq = seq;
    s.cursor.last_applied_timestamp = timestamp;
    s.cursor.last_price = price;
    s.cursor.last_total_supply = total_supply;
    return true;
}

bool SyncLedger::is_fresh(const CurveKey& key, uint64_t seq) const {
    Slot* s = find(key);
    if (!s) return seq > 0;
    std::lock_guard lock(s->mutex);
    return seq > s->cursor.last_applied_seq;
}

std::optional<SyncCursor> SyncLedger::cursor(const CurveKey& key) const {
    Slot* s = find(key);
    if (!s) return std::nullopt;
    std::lock_guard lock(s->mutex);
    return s->cursor;
}

size_t SyncLedger::register_batch(const std::vector<CurveKey>& keys) {
    std::unique_lock lock(slots_mutex_);
    size_t created = 0;
    for (const auto& key : keys) {
        auto& entry = slots_[key];
        if (entry) continue;
        entry = std::make_unique<Slot>();
        ++created;
    }
    return created;
}

size_t SyncLedger::size() const {
    std::shared_lock lock(slots_mutex_);
    return slots_.size();
}

} // namespace launchpad
