// Launchpad - Migration State Machine Tests

#include <catch2/catch_test_macros.hpp>
#include <launchpad/errors.hpp>
#include <launchpad/migration.hpp>

#include <atomic>
#include <functional>
#include <thread>
#include <vector>

using namespace launchpad;

namespace {

CurveParams deep_params() {
    CurveParams params;
    params.initial_virtual_tokens = static_cast<U128>(1073000000ULL) * WAD;
    return params;
}

class RecordingMigrator : public LiquidityMigrator {
public:
    MigrationOutcome migrate(const MigrationRequest& request) override {
        ++calls;
        last = request;
        if (fail_next) {
            fail_next = false;
            return MigrationOutcome::failure("router reverted");
        }
        Address pair{};
        pair[19] = 0x42;
        return MigrationOutcome::ok(pair);
    }

    int calls = 0;
    bool fail_next = false;
    MigrationRequest last{};
};

int32_t state_error_code(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const StateError& e) {
        return e.code();
    }
    return errors::OK;
}

} // namespace

TEST_CASE("Curve registration", "[migration]") {
    MigrationStateMachine curves;
    CurveKey key{1, 97};

    REQUIRE(curves.register_curve(key) == errors::OK);
    REQUIRE(curves.register_curve(key) == errors::ALREADY_REGISTERED);
    REQUIRE(curves.has_curve(key));
    REQUIRE_FALSE(curves.has_curve(CurveKey{1, 80002}));

    REQUIRE(curves.register_batch({{1, 97}, {1, 80002}, {2, 97}}) == 2);
    REQUIRE(curves.get_stats().total_curves == 3);

    auto record = curves.migration_record(key);
    REQUIRE(record.has_value());
    REQUIRE(record->status == MigrationStatus::Active);

    SECTION("Unknown key") {
        REQUIRE_FALSE(curves.curve_state(CurveKey{9, 9}).has_value());
        REQUIRE_THROWS_AS(curves.buy(CurveKey{9, 9}, WAD, 0, fees::NO_SLIPPAGE_LIMIT),
                          ValidationError);
    }
}

TEST_CASE("Active -> MigrationTriggered -> Migrated", "[migration]") {
    MigrationStateMachine curves(deep_params());
    CurveKey key{7, 11155111};
    curves.register_curve(key);
    RecordingMigrator migrator;

    SECTION("Migrate before trigger is rejected") {
        int32_t code = state_error_code([&] { curves.migrate(key, migrator); });
        REQUIRE(code == errors::MIGRATION_NOT_TRIGGERED);
        REQUIRE(migrator.calls == 0);
    }

    BuyResult buy = curves.buy(key, 10 * WAD, 0, fees::NO_SLIPPAGE_LIMIT);
    REQUIRE(buy.migration_triggered);

    auto triggered = curves.migration_record(key);
    REQUIRE(triggered->status == MigrationStatus::MigrationTriggered);
    REQUIRE(triggered->liquidity_tokens == supply::LIQUIDITY_RESERVE);
    REQUIRE(triggered->liquidity_eth == buy.state.virtual_eth);

    SECTION("Trades are rejected once triggered") {
        int32_t code = state_error_code([&] {
            curves.buy(key, WAD, 0, fees::NO_SLIPPAGE_LIMIT);
        });
        REQUIRE(code == errors::CURVE_MIGRATED);
        code = state_error_code([&] {
            curves.sell(key, WAD, 0, fees::NO_SLIPPAGE_LIMIT);
        });
        REQUIRE(code == errors::CURVE_MIGRATED);
    }

    SECTION("Migration commits once") {
        MigrationRecord done = curves.migrate(key, migrator);
        REQUIRE(done.status == MigrationStatus::Migrated);
        REQUIRE(done.liquidity_pair[19] == 0x42);
        REQUIRE(done.migrated_at > 0);
        REQUIRE(migrator.last.key == key);
        REQUIRE(migrator.last.liquidity_tokens == supply::LIQUIDITY_RESERVE);
        REQUIRE(curves.get_stats().total_migrations == 1);

        int32_t code = state_error_code([&] { curves.migrate(key, migrator); });
        REQUIRE(code == errors::ALREADY_MIGRATED);
        REQUIRE(migrator.calls == 1);

        code = state_error_code([&] { curves.buy(key, WAD, 0, fees::NO_SLIPPAGE_LIMIT); });
        REQUIRE(code == errors::CURVE_MIGRATED);
    }

    SECTION("Failed migration stays triggered and can be retried") {
        migrator.fail_next = true;
        REQUIRE_THROWS_AS(curves.migrate(key, migrator), NetworkError);
        REQUIRE(curves.migration_record(key)->status == MigrationStatus::MigrationTriggered);

        MigrationRecord done = curves.migrate(key, migrator);
        REQUIRE(done.status == MigrationStatus::Migrated);
        REQUIRE(migrator.calls == 2);
    }
}

TEST_CASE("Concurrent migrations invoke the migrator once", "[migration]") {
    MigrationStateMachine curves(deep_params());
    CurveKey key{3, 84532};
    curves.register_curve(key);
    curves.buy(key, 10 * WAD, 0, fees::NO_SLIPPAGE_LIMIT);

    RecordingMigrator inner;
    std::mutex inner_mutex;
    class LockedMigrator : public LiquidityMigrator {
    public:
        LockedMigrator(RecordingMigrator& m, std::mutex& mu) : m_(m), mu_(mu) {}
        MigrationOutcome migrate(const MigrationRequest& request) override {
            std::lock_guard<std::mutex> lock(mu_);
            return m_.migrate(request);
        }
    private:
        RecordingMigrator& m_;
        std::mutex& mu_;
    } migrator(inner, inner_mutex);

    std::atomic<int> migrated{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            try {
                curves.migrate(key, migrator);
                ++migrated;
            } catch (const StateError& e) {
                if (e.code() == errors::ALREADY_MIGRATED) ++rejected;
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(migrated.load() == 1);
    REQUIRE(rejected.load() == 7);
    REQUIRE(inner.calls == 1);
}

TEST_CASE("Trade sequence gate", "[migration]") {
    MigrationStateMachine curves;
    CurveKey key{5, 97};
    curves.register_curve(key);

    curves.buy(key, WAD / 10, 0, fees::NO_SLIPPAGE_LIMIT, 4);
    REQUIRE(curves.curve_state(key)->last_update_seq == 4);

    SECTION("Replayed and older seqs are discarded untouched") {
        CurveState before = *curves.curve_state(key);
        REQUIRE_THROWS_AS(curves.buy(key, WAD / 10, 0, fees::NO_SLIPPAGE_LIMIT, 4),
                          ConsistencyError);
        REQUIRE_THROWS_AS(curves.sell(key, 1, 0, fees::NO_SLIPPAGE_LIMIT, 2), ConsistencyError);
        CurveState after = *curves.curve_state(key);
        REQUIRE(after.virtual_eth == before.virtual_eth);
        REQUIRE(after.total_supply == before.total_supply);
        REQUIRE(curves.get_stats().total_buys == 1);
    }

    SECTION("Zero seq bypasses the gate") {
        curves.buy(key, WAD / 10, 0, fees::NO_SLIPPAGE_LIMIT);
        REQUIRE(curves.curve_state(key)->last_update_seq == 4);
        curves.sell(key, WAD, 0, fees::NO_SLIPPAGE_LIMIT, 5);
        REQUIRE(curves.curve_state(key)->last_update_seq == 5);
    }
}

TEST_CASE("Pause and unpause", "[migration]") {
    MigrationStateMachine curves;
    CurveKey key{6, 80002};
    curves.register_curve(key);

    REQUIRE(curves.pause(key) == errors::OK);
    REQUIRE(curves.snapshot(key)->paused);

    int32_t code = state_error_code([&] { curves.buy(key, WAD, 0, fees::NO_SLIPPAGE_LIMIT); });
    REQUIRE(code == errors::CURVE_PAUSED);

    REQUIRE(curves.unpause(key) == errors::OK);
    REQUIRE_NOTHROW(curves.buy(key, WAD, 0, fees::NO_SLIPPAGE_LIMIT));

    REQUIRE(curves.pause(CurveKey{99, 1}) == errors::NOT_FOUND);
    REQUIRE(curves.unpause(CurveKey{99, 1}) == errors::NOT_FOUND);
}

TEST_CASE("Snapshots and stats", "[migration]") {
    MigrationStateMachine curves;
    curves.register_batch({{8, 97}, {8, 1}, {8, 80002}, {9, 97}});

    curves.buy(CurveKey{8, 97}, WAD, 0, fees::NO_SLIPPAGE_LIMIT);
    curves.buy(CurveKey{8, 1}, WAD / 2, 0, fees::NO_SLIPPAGE_LIMIT);

    auto snaps = curves.snapshots_for_launch(8);
    REQUIRE(snaps.size() == 3);
    REQUIRE(snaps[0].key.chain_id == 1);
    REQUIRE(snaps[1].key.chain_id == 97);
    REQUIRE(snaps[2].key.chain_id == 80002);
    REQUIRE(snaps[2].state.total_supply == 0);

    auto stats = curves.get_stats();
    REQUIRE(stats.total_buys == 2);
    REQUIRE(stats.total_volume_eth == WAD + WAD / 2);
    REQUIRE(stats.total_fees_eth == (WAD + WAD / 2) / 50);
}
