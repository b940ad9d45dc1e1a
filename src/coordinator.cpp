// =============================================================================
// coordinator.cpp - Cross-chain synchronization of launches
// =============================================================================

#include "launchpad/coordinator.hpp"
#include "launchpad/curve.hpp"
#include "launchpad/errors.hpp"
#include "launchpad/math.hpp"
#include "launchpad/retry.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <limits>

namespace launchpad {

namespace {

uint64_t unix_time() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

std::string leg_name(const char* action, const CurveKey& key) {
    return std::string(action) + " launch " + std::to_string(key.launch_id) +
           " on chain " + std::to_string(key.chain_id);
}

// Combined reserves of every chain of a launch
struct Aggregate {
    U128 virtual_eth = 0;
    U128 virtual_tokens = 0;
    U128 total_supply = 0;
    uint64_t seq = 0;
    U128 price = 0;
};

Aggregate aggregate(const std::vector<CurveSnapshot>& snapshots) {
    Aggregate agg;
    for (const auto& s : snapshots) {
        agg.virtual_eth = math::checked_add(agg.virtual_eth, s.state.virtual_eth);
        agg.virtual_tokens = math::checked_add(agg.virtual_tokens, s.state.virtual_tokens);
        agg.total_supply = math::checked_add(agg.total_supply, s.state.total_supply);
        agg.seq += s.state.last_update_seq;
    }
    if (agg.virtual_tokens == 0) {
        throw ArithmeticError("unified price: zero combined token reserve", errors::DIVISION_BY_ZERO);
    }
    agg.price = math::mul_div(agg.virtual_eth, WAD, agg.virtual_tokens);
    return agg;
}

// LiquidityMigrator backed by a chain's migrate_to_dex, with retries
class ClientMigrator : public LiquidityMigrator {
public:
    ClientMigrator(ChainClient& client, const Address& caller, const RetryPolicy& policy)
        : client_(client), caller_(caller), policy_(policy) {}

    MigrationOutcome migrate(const MigrationRequest& request) override {
        try {
            DexMigrationResult result = with_retry(policy_, leg_name("migrate", request.key), [&] {
                return client_.migrate_to_dex(caller_, request.key.launch_id);
            }, &attempts_);
            return MigrationOutcome::ok(result.liquidity_pair);
        } catch (const StateError& e) {
            if (e.code() != errors::ALREADY_MIGRATED) throw;
            spdlog::debug("Chain {} reports launch {} already migrated",
                          request.key.chain_id, request.key.launch_id);
            return MigrationOutcome::ok(Address{});
        } catch (const NetworkError& e) {
            return MigrationOutcome::failure(e.what());
        }
    }

    uint32_t attempts() const { return attempts_; }

private:
    ChainClient& client_;
    Address caller_;
    RetryPolicy policy_;
    uint32_t attempts_ = 0;
};

} // anonymous namespace

// =============================================================================
// Constructor / Wiring
// =============================================================================

CrossChainCoordinator::CrossChainCoordinator(CoordinatorConfig config,
                                             std::shared_ptr<AllowList> allow_list)
    : config_(std::move(config)),
      allow_list_(std::move(allow_list)),
      curves_(config_.curve) {
    config_.validate();
    if (!allow_list_) {
        throw ValidationError("coordinator requires an allow-list");
    }
    if (is_zero_address(config_.coordinator)) {
        throw ValidationError("coordinator identity is the zero address", errors::ZERO_ADDRESS);
    }
}

CrossChainCoordinator::~CrossChainCoordinator() {
    stop();
}

void CrossChainCoordinator::add_chain(std::shared_ptr<ChainClient> client) {
    if (!client) {
        throw ValidationError("null chain client");
    }
    ChainId chain_id = client->chain_id();
    std::unique_lock lock(clients_mutex_);
    if (!clients_.emplace(chain_id, std::move(client)).second) {
        throw ValidationError("chain " + std::to_string(chain_id) + " already added",
                              errors::UNSUPPORTED_CHAIN);
    }
    spdlog::info("Added chain {}", chain_id);
}

void CrossChainCoordinator::add_event_source(std::shared_ptr<EventSource> source) {
    if (!source) {
        throw ValidationError("null event source");
    }
    if (!has_chain(source->chain_id())) {
        throw ValidationError("event source for unknown chain " +
                              std::to_string(source->chain_id()), errors::UNSUPPORTED_CHAIN);
    }

    std::lock_guard lock(workers_mutex_);
    sources_.push_back(source);
    if (running_.load()) {
        workers_.emplace_back(&CrossChainCoordinator::worker_loop, this, source);
    }
}

bool CrossChainCoordinator::has_chain(ChainId chain_id) const {
    std::shared_lock lock(clients_mutex_);
    return clients_.count(chain_id) > 0;
}

std::shared_ptr<ChainClient> CrossChainCoordinator::client_for(ChainId chain_id) const {
    std::shared_lock lock(clients_mutex_);
    auto it = clients_.find(chain_id);
    if (it == clients_.end()) {
        throw ValidationError("no client for chain " + std::to_string(chain_id),
                              errors::UNSUPPORTED_CHAIN);
    }
    return it->second;
}

Launch CrossChainCoordinator::require_launch(LaunchId launch_id) const {
    auto launch = launches_.get(launch_id);
    if (!launch) {
        // Trades can overtake the creation event on the wire
        throw ConsistencyError("launch " + std::to_string(launch_id) + " not created yet");
    }
    return *launch;
}

// =============================================================================
// Lifecycle
// =============================================================================

bool CrossChainCoordinator::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }

    std::lock_guard lock(workers_mutex_);
    for (const auto& source : sources_) {
        workers_.emplace_back(&CrossChainCoordinator::worker_loop, this, source);
    }
    spdlog::info("Coordinator started with {} event sources", sources_.size());
    return true;
}

void CrossChainCoordinator::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    std::lock_guard lock(workers_mutex_);
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    spdlog::info("Coordinator stopped");
}

void CrossChainCoordinator::join() {
    std::lock_guard lock(workers_mutex_);
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    running_.store(false);
}

void CrossChainCoordinator::worker_loop(std::shared_ptr<EventSource> source) {
    const ChainId chain_id = source->chain_id();
    const auto timeout = std::chrono::milliseconds(config_.general.poll_timeout_ms);
    spdlog::debug("Worker for chain {} started", chain_id);

    while (running_.load()) {
        std::optional<ChainEvent> event;
        try {
            event = source->next(timeout);
        } catch (const NetworkError& e) {
            spdlog::warn("Event source for chain {} failed: {}", chain_id, e.what());
            std::this_thread::sleep_for(config_.retry.initial_backoff);
            continue;
        } catch (const LaunchpadError& e) {
            source_errors_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("Event source for chain {} returned a bad reply ({}): {}",
                          chain_id, to_string(e.kind()), e.what());
            std::this_thread::sleep_for(config_.retry.initial_backoff);
            continue;
        }

        if (!event) {
            if (source->closed()) break;
            continue;
        }
        if (event->chain_id != chain_id) {
            events_rejected_.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("Event for chain {} arrived on the chain {} stream", event->chain_id, chain_id);
            continue;
        }

        handle(*event);
    }

    spdlog::debug("Worker for chain {} stopped", chain_id);
}

// =============================================================================
// Event Handling
// =============================================================================

HandleResult CrossChainCoordinator::handle(const ChainEvent& event) {
    const char* type = event.type_name();
    try {
        // Checks before any state read
        allow_list_->require(event.caller);
        if (!has_chain(event.chain_id)) {
            throw ValidationError("event from unknown chain " + std::to_string(event.chain_id),
                                  errors::UNSUPPORTED_CHAIN);
        }

        HandleResult result = HandleResult::ok();
        if (const auto* created = std::get_if<TokenCreated>(&event.payload)) {
            result = on_created(event, *created);
        } else if (const auto* purchase = std::get_if<TokenPurchase>(&event.payload)) {
            result = on_purchase(event, *purchase);
        } else if (const auto* sale = std::get_if<TokenSale>(&event.payload)) {
            result = on_sale(event, *sale);
        } else if (const auto* triggered = std::get_if<CurveMigrationTriggered>(&event.payload)) {
            result = on_migration(event, *triggered);
        }

        events_handled_.fetch_add(1, std::memory_order_relaxed);
        return result;
    } catch (const AuthorizationError& e) {
        events_rejected_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("Rejected {} from chain {}: {}", type, event.chain_id, e.what());
        return HandleResult::failure(e.code(), e.what());
    } catch (const ConsistencyError& e) {
        events_discarded_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Discarded {} from chain {}: {}", type, event.chain_id, e.what());
        return HandleResult::ok(e.code(), e.what());
    } catch (const StateError& e) {
        if (e.code() == errors::CURVE_PAUSED) {
            events_rejected_.fetch_add(1, std::memory_order_relaxed);
            spdlog::info("Held back {} from chain {}: {}", type, event.chain_id, e.what());
            return HandleResult::failure(e.code(), e.what());
        }
        events_discarded_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("No-op {} from chain {}: {}", type, event.chain_id, e.what());
        return HandleResult::ok(e.code(), e.what());
    } catch (const ArithmeticError& e) {
        events_rejected_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("Arithmetic failure on {} for launch {} on chain {}: {}",
                      type, event.launch_id(), event.chain_id, e.what());
        return HandleResult::failure(e.code(), e.what());
    } catch (const LaunchpadError& e) {
        events_rejected_.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("Rejected {} from chain {} ({}): {}", type, event.chain_id,
                     to_string(e.kind()), e.what());
        return HandleResult::failure(e.code(), e.what());
    } catch (const std::exception& e) {
        events_rejected_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("Unexpected failure on {} for launch {} from chain {}: {}",
                      type, event.launch_id(), event.chain_id, e.what());
        return HandleResult::failure(errors::INTERNAL_ERROR, e.what());
    }
}

HandleResult CrossChainCoordinator::on_created(const ChainEvent& event, const TokenCreated& created) {
    if (created.origin_chain_id != event.chain_id) {
        throw ValidationError("TokenCreated for origin chain " +
                              std::to_string(created.origin_chain_id) + " delivered from chain " +
                              std::to_string(event.chain_id), errors::UNSUPPORTED_CHAIN);
    }

    Launch launch{created.launch_id, created.creator, created.name, created.symbol,
                  created.origin_chain_id,
                  {created.target_chain_ids.begin(), created.target_chain_ids.end()},
                  created.timestamp != 0 ? created.timestamp : unix_time()};
    for (ChainId chain : launch.all_chains()) {
        if (!has_chain(chain)) {
            throw ValidationError("launch targets unsupported chain " + std::to_string(chain),
                                  errors::UNSUPPORTED_CHAIN);
        }
    }

    HandleResult result = HandleResult::ok();
    if (launches_.register_launch(launch) == errors::ALREADY_REGISTERED) {
        // Re-delivery: keep the first record, re-run the idempotent fan-out
        launch = require_launch(launch.launch_id);
        result = HandleResult::ok(errors::ALREADY_REGISTERED, "launch already registered");
        spdlog::debug("Duplicate TokenCreated for launch {}", launch.launch_id);
    } else {
        spdlog::info("Registered launch {} ({}) across {} chains",
                     launch.launch_id, launch.symbol, launch.all_chains().size());
    }

    for (ChainId chain : launch.all_chains()) {
        if (curves_.register_curve(CurveKey{launch.launch_id, chain}) == errors::OK) {
            spdlog::debug("Opened curve for launch {} on chain {}", launch.launch_id, chain);
        }
    }

    // The origin deployment already exists; record it at its predicted address
    const ChainId origin = launch.origin_chain_id;
    const uint64_t origin_salt = deployment_salt(launch.launch_id, origin);
    deployments_.try_deploy(CurveKey{launch.launch_id, origin}, origin_salt, [origin_salt] {
        return DeployedAddresses{predict_token_address(origin_salt),
                                 predict_curve_address(origin_salt)};
    });
    const Address origin_token = predict_token_address(origin_salt);

    std::vector<std::future<bool>> legs;
    for (ChainId chain : launch.all_chains()) {
        if (chain == origin) continue;
        DeployRequest request{launch.launch_id, launch.name, launch.symbol, launch.creator,
                              origin_token, origin, deployment_salt(launch.launch_id, chain)};
        legs.push_back(std::async(std::launch::async, [this, request, chain] {
            return deploy_leg(request, chain);
        }));
    }

    for (auto& leg : legs) {
        result.legs_dispatched++;
        if (!leg.get()) result.legs_failed++;
    }
    return result;
}

HandleResult CrossChainCoordinator::on_purchase(const ChainEvent& event, const TokenPurchase& purchase) {
    Launch launch = require_launch(purchase.launch_id);
    if (purchase.seq == 0) {
        throw ValidationError("TokenPurchase without a sequence number");
    }

    CurveKey key{purchase.launch_id, event.chain_id};
    if (!curves_.has_curve(key)) {
        throw ConsistencyError("no curve for " + leg_name("buy", key));
    }

    // Already executed on chain; replay without a slippage bound
    BuyResult applied = curves_.buy(key, purchase.eth_in, 0, fees::NO_SLIPPAGE_LIMIT, purchase.seq);
    if (applied.tokens_out != purchase.tokens_out) {
        spdlog::warn("Launch {} chain {} seq {}: replayed {} tokens, event reported {}",
                     key.launch_id, key.chain_id, purchase.seq,
                     math::to_string(applied.tokens_out), math::to_string(purchase.tokens_out));
    }

    if (applied.migration_triggered) {
        spdlog::info("Curve of launch {} filled on chain {}, migrating", key.launch_id, key.chain_id);
        HandleResult result = HandleResult::ok();
        result.legs_dispatched = 1;
        if (!migrate_leg(key)) result.legs_failed = 1;
        return result;
    }
    return propagate_price(launch, event.chain_id);
}

HandleResult CrossChainCoordinator::on_sale(const ChainEvent& event, const TokenSale& sale) {
    Launch launch = require_launch(sale.launch_id);
    if (sale.seq == 0) {
        throw ValidationError("TokenSale without a sequence number");
    }

    CurveKey key{sale.launch_id, event.chain_id};
    if (!curves_.has_curve(key)) {
        throw ConsistencyError("no curve for " + leg_name("sell", key));
    }

    SellResult applied = curves_.sell(key, sale.tokens_in, 0, fees::NO_SLIPPAGE_LIMIT, sale.seq);
    if (applied.eth_out != sale.eth_out) {
        spdlog::warn("Launch {} chain {} seq {}: replayed {} wei out, event reported {}",
                     key.launch_id, key.chain_id, sale.seq,
                     math::to_string(applied.eth_out), math::to_string(sale.eth_out));
    }
    return propagate_price(launch, event.chain_id);
}

HandleResult CrossChainCoordinator::on_migration(const ChainEvent& event,
                                                 const CurveMigrationTriggered& triggered) {
    CurveKey key{triggered.launch_id, event.chain_id};
    auto record = curves_.migration_record(key);
    if (!record) {
        throw ConsistencyError("migration trigger for unknown curve: " + leg_name("migrate", key));
    }

    switch (record->status) {
        case MigrationStatus::Active:
            throw ConsistencyError("migration trigger ahead of the filling trade: " +
                                   leg_name("migrate", key));
        case MigrationStatus::Migrated:
            throw StateError(errors::ALREADY_MIGRATED, "already migrated: " + leg_name("migrate", key));
        case MigrationStatus::MigrationTriggered:
            break;
    }

    if (triggered.final_price != record->final_price) {
        spdlog::warn("Launch {} chain {}: trigger reports final price {}, curve has {}",
                     key.launch_id, key.chain_id, math::to_string(triggered.final_price),
                     math::to_string(record->final_price));
    }

    HandleResult result = HandleResult::ok();
    result.legs_dispatched = 1;
    if (!migrate_leg(key)) result.legs_failed = 1;
    return result;
}

HandleResult CrossChainCoordinator::propagate_price(const Launch& launch, ChainId source_chain) {
    Aggregate agg = aggregate(curves_.snapshots_for_launch(launch.launch_id));
    PriceSync sync{launch.launch_id, agg.price, agg.total_supply, agg.seq};

    std::vector<std::future<bool>> legs;
    for (ChainId chain : launch.all_chains()) {
        if (chain == source_chain) continue;

        CurveKey key{launch.launch_id, chain};
        if (!deployments_.is_deployed(key)) {
            spdlog::debug("Skipping sync to chain {}: launch {} not deployed", chain, launch.launch_id);
            continue;
        }
        auto migration = curves_.migration_record(key);
        if (migration && migration->status != MigrationStatus::Active) {
            continue;
        }
        if (!sync_ledger_.is_fresh(key, sync.seq)) {
            spdlog::debug("Skipping stale sync seq {} to chain {}", sync.seq, chain);
            continue;
        }

        legs.push_back(std::async(std::launch::async, [this, key, sync] {
            return sync_leg(key, sync);
        }));
    }

    HandleResult result = HandleResult::ok();
    for (auto& leg : legs) {
        result.legs_dispatched++;
        if (!leg.get()) result.legs_failed++;
    }
    return result;
}

// =============================================================================
// Fan-out Legs
// =============================================================================

bool CrossChainCoordinator::deploy_leg(const DeployRequest& request, ChainId chain_id) {
    const CurveKey key{request.launch_id, chain_id};
    uint32_t attempts = 0;
    try {
        auto client = client_for(chain_id);
        DeployOutcome outcome = deployments_.try_deploy(key, request.salt, [&] {
            return with_retry(config_.retry, leg_name("deploy", key), [&] {
                try {
                    return client->deploy_token(config_.coordinator, request);
                } catch (const StateError& e) {
                    if (e.code() != errors::ALREADY_DEPLOYED) throw;
                    // Landed by an earlier attempt whose reply was lost
                    return DeployedAddresses{predict_token_address(request.salt),
                                             predict_curve_address(request.salt)};
                }
            }, &attempts);
        });

        if (outcome.created) {
            deployments_made_.fetch_add(1, std::memory_order_relaxed);
            spdlog::info("Deployed launch {} on chain {}: token {} curve {}",
                         key.launch_id, chain_id, to_hex(outcome.record.token_address),
                         to_hex(outcome.record.curve_address));
        }
        return true;
    } catch (const NetworkError& e) {
        dead_letters_.park(DeadLetter{0, LegKind::Deploy, key, attempts, e.what(), 0, request, std::nullopt});
        spdlog::error("Dead-lettered deploy of launch {} on chain {} after {} attempts: {}",
                      key.launch_id, chain_id, attempts, e.what());
        return false;
    } catch (const LaunchpadError& e) {
        spdlog::error("Deploy of launch {} on chain {} failed ({}): {}",
                      key.launch_id, chain_id, to_string(e.kind()), e.what());
        return false;
    } catch (const std::exception& e) {
        spdlog::error("Deploy of launch {} on chain {} failed: {}", key.launch_id, chain_id, e.what());
        return false;
    }
}

bool CrossChainCoordinator::sync_leg(const CurveKey& key, const PriceSync& sync) {
    uint32_t attempts = 0;
    try {
        auto client = client_for(key.chain_id);
        with_retry(config_.retry, leg_name("sync", key), [&] {
            client->sync_price(config_.coordinator, sync);
        }, &attempts);

        if (sync_ledger_.try_advance(key, sync.seq, unix_time(), sync.price, sync.total_supply)) {
            syncs_sent_.fetch_add(1, std::memory_order_relaxed);
        }
        return true;
    } catch (const NetworkError& e) {
        dead_letters_.park(DeadLetter{0, LegKind::SyncPrice, key, attempts, e.what(), 0, std::nullopt, sync});
        spdlog::error("Dead-lettered price sync seq {} to chain {} after {} attempts: {}",
                      sync.seq, key.chain_id, attempts, e.what());
        return false;
    } catch (const LaunchpadError& e) {
        spdlog::error("Price sync seq {} to chain {} failed ({}): {}",
                      sync.seq, key.chain_id, to_string(e.kind()), e.what());
        return false;
    } catch (const std::exception& e) {
        spdlog::error("Price sync seq {} to chain {} failed: {}", sync.seq, key.chain_id, e.what());
        return false;
    }
}

bool CrossChainCoordinator::migrate_leg(const CurveKey& key) {
    std::shared_ptr<ChainClient> client;
    try {
        client = client_for(key.chain_id);
    } catch (const ValidationError& e) {
        spdlog::error("Cannot migrate launch {}: {}", key.launch_id, e.what());
        return false;
    }

    ClientMigrator migrator(*client, config_.coordinator, config_.retry);
    try {
        MigrationRecord record = curves_.migrate(key, migrator);
        migrations_.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("Migrated launch {} on chain {}: pair {}, {} ETH and {} tokens at price {}",
                     key.launch_id, key.chain_id, to_hex(record.liquidity_pair),
                     math::format_units(record.liquidity_eth),
                     math::format_units(record.liquidity_tokens),
                     math::format_units(record.final_price));
        return true;
    } catch (const StateError& e) {
        if (e.code() == errors::ALREADY_MIGRATED) {
            spdlog::debug("Migration of launch {} on chain {} already done", key.launch_id, key.chain_id);
            return true;
        }
        spdlog::error("Migration of launch {} on chain {} refused: {}", key.launch_id, key.chain_id, e.what());
        return false;
    } catch (const NetworkError& e) {
        dead_letters_.park(DeadLetter{0, LegKind::Migrate, key, migrator.attempts(), e.what(), 0,
                                      std::nullopt, std::nullopt});
        spdlog::error("Dead-lettered migration of launch {} on chain {} after {} attempts: {}",
                      key.launch_id, key.chain_id, migrator.attempts(), e.what());
        return false;
    } catch (const LaunchpadError& e) {
        spdlog::error("Migration of launch {} on chain {} failed ({}): {}",
                      key.launch_id, key.chain_id, to_string(e.kind()), e.what());
        return false;
    } catch (const std::exception& e) {
        spdlog::error("Migration of launch {} on chain {} failed: {}",
                      key.launch_id, key.chain_id, e.what());
        return false;
    }
}

// =============================================================================
// Aggregation
// =============================================================================

std::optional<U128> CrossChainCoordinator::unified_price(LaunchId launch_id) const {
    auto snapshots = curves_.snapshots_for_launch(launch_id);
    if (snapshots.empty()) return std::nullopt;
    return aggregate(snapshots).price;
}

std::optional<PriceReport> CrossChainCoordinator::price_report(LaunchId launch_id) const {
    auto snapshots = curves_.snapshots_for_launch(launch_id);
    if (snapshots.empty()) return std::nullopt;

    Aggregate agg = aggregate(snapshots);
    PriceReport report{launch_id, agg.price, agg.total_supply, {}, 0, false};
    report.chains.reserve(snapshots.size());

    for (const auto& s : snapshots) {
        U128 price = price_engine::current_price(s.state);
        bool below = price < agg.price;
        U128 diff = below ? agg.price - price : price - agg.price;
        U128 bps = agg.price == 0 ? 0 : math::mul_div(diff, fees::BPS_DENOMINATOR, agg.price);
        U128 capped = std::min<U128>(bps, static_cast<U128>(std::numeric_limits<int32_t>::max()));

        int32_t deviation = static_cast<int32_t>(capped);
        report.chains.push_back(ChainPrice{s.key.chain_id, price, s.state.total_supply,
                                           below ? -deviation : deviation});
        report.max_deviation_bps = std::max(report.max_deviation_bps, static_cast<uint32_t>(capped));
    }

    report.needs_rebalance = report.max_deviation_bps >= config_.general.rebalance_threshold_bps;
    return report;
}

// =============================================================================
// Operations
// =============================================================================

size_t CrossChainCoordinator::redispatch_dead_letters() {
    std::vector<DeadLetter> letters = dead_letters_.drain();
    size_t completed = 0;

    for (const auto& letter : letters) {
        bool done = false;
        switch (letter.kind) {
            case LegKind::Deploy:
                if (letter.deploy) {
                    done = deploy_leg(*letter.deploy, letter.key.chain_id);
                } else {
                    spdlog::error("Deploy dead letter {} has no request", letter.id);
                }
                break;
            case LegKind::SyncPrice:
                if (!letter.sync) {
                    spdlog::error("Sync dead letter {} has no payload", letter.id);
                } else if (!sync_ledger_.is_fresh(letter.key, letter.sync->seq)) {
                    done = true;   // superseded by a later sync
                } else {
                    done = sync_leg(letter.key, *letter.sync);
                }
                break;
            case LegKind::Migrate:
                done = migrate_leg(letter.key);
                break;
        }
        if (done) ++completed;
    }

    if (!letters.empty()) {
        spdlog::info("Re-dispatched {} dead letters, {} completed", letters.size(), completed);
    }
    return completed;
}

HandleResult CrossChainCoordinator::pause(const Address& caller, const CurveKey& key) {
    if (caller != allow_list_->admin()) {
        spdlog::warn("Pause of launch {} on chain {} by non-admin {}",
                     key.launch_id, key.chain_id, to_hex(caller));
        return HandleResult::failure(errors::UNAUTHORIZED, "pause is admin-only");
    }
    int32_t rc = curves_.pause(key);
    if (rc != errors::OK) {
        return HandleResult::failure(rc, errors::describe(rc));
    }
    spdlog::warn("Paused launch {} on chain {}", key.launch_id, key.chain_id);
    return HandleResult::ok();
}

HandleResult CrossChainCoordinator::unpause(const Address& caller, const CurveKey& key) {
    if (caller != allow_list_->admin()) {
        spdlog::warn("Unpause of launch {} on chain {} by non-admin {}",
                     key.launch_id, key.chain_id, to_hex(caller));
        return HandleResult::failure(errors::UNAUTHORIZED, "unpause is admin-only");
    }
    int32_t rc = curves_.unpause(key);
    if (rc != errors::OK) {
        return HandleResult::failure(rc, errors::describe(rc));
    }
    spdlog::info("Unpaused launch {} on chain {}", key.launch_id, key.chain_id);
    return HandleResult::ok();
}

CrossChainCoordinator::Stats CrossChainCoordinator::get_stats() const {
    return Stats{
        events_handled_.load(std::memory_order_relaxed),
        events_rejected_.load(std::memory_order_relaxed),
        events_discarded_.load(std::memory_order_relaxed),
        deployments_made_.load(std::memory_order_relaxed),
        syncs_sent_.load(std::memory_order_relaxed),
        migrations_.load(std::memory_order_relaxed),
        dead_letters_.total_parked(),
        source_errors_.load(std::memory_order_relaxed)
    };
}

} // namespace launchpad
