#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "events.hpp"
#include "registry.hpp"
#include "types.hpp"

namespace launchpad {

/// Request to create the token and curve contracts of a launch on one chain
struct DeployRequest {
    LaunchId launch_id;
    std::string name;
    std::string symbol;
    Address creator;
    Address origin_token;
    ChainId origin_chain_id;
    uint64_t salt;
};

/// Unified price pushed to a destination chain
struct PriceSync {
    LaunchId launch_id;
    U128 price;
    U128 total_supply;
    uint64_t seq;
};

/// Outcome of moving a curve's liquidity into an exchange pool
struct DexMigrationResult {
    Address liquidity_pair;
    U128 final_price;
    U128 liquidity_eth;
    U128 liquidity_tokens;
};

/// Calls into one chain. Implementations bound every call by a timeout and
/// report transport failures as NetworkError.
class ChainClient {
public:
    virtual ~ChainClient() = default;

    virtual ChainId chain_id() const = 0;

    /// Throws StateError(ALREADY_DEPLOYED) if the launch already exists there
    virtual DeployedAddresses deploy_token(const Address& caller, const DeployRequest& request) = 0;

    /// Stale seq values are dropped by the destination without error
    virtual void sync_price(const Address& caller, const PriceSync& sync) = 0;

    /// Throws StateError(ALREADY_MIGRATED) when the curve is already terminal
    virtual DexMigrationResult migrate_to_dex(const Address& caller, LaunchId launch_id) = 0;
};

/// Blocking stream of events from one chain, consumed in delivery order
class EventSource {
public:
    virtual ~EventSource() = default;

    virtual ChainId chain_id() const = 0;

    /// Waits up to `timeout`; nullopt when nothing arrived or the source closed
    virtual std::optional<ChainEvent> next(std::chrono::milliseconds timeout) = 0;

    virtual bool closed() const = 0;
};

/// In-process event stream fed by push()
class QueueEventSource : public EventSource {
public:
    explicit QueueEventSource(ChainId chain_id);

    ChainId chain_id() const override { return chain_id_; }
    std::optional<ChainEvent> next(std::chrono::milliseconds timeout) override;
    bool closed() const override;

    /// Events pushed after close() are ignored
    void push(ChainEvent event);
    void close();

    size_t pending() const;

private:
    ChainId chain_id_;
    std::deque<ChainEvent> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace launchpad
