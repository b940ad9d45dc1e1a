// Launchpad - Relayer HTTP Adapters

#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "chain_client.hpp"

namespace launchpad {

/// ChainClient talking JSON to a chain's relayer:
///   POST /v1/deploy, /v1/sync, /v1/migrate
/// 403 maps to AuthorizationError, 409 to StateError, transport failures,
/// timeouts and 5xx to NetworkError, other 4xx to ValidationError.
class HttpChainClient : public ChainClient {
public:
    HttpChainClient(ChainId chain_id, std::string base_url,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    ChainId chain_id() const override { return chain_id_; }
    DeployedAddresses deploy_token(const Address& caller, const DeployRequest& request) override;
    void sync_price(const Address& caller, const PriceSync& sync) override;
    DexMigrationResult migrate_to_dex(const Address& caller, LaunchId launch_id) override;

    const std::string& base_url() const { return base_url_; }

private:
    ChainId chain_id_;
    std::string base_url_;
    std::chrono::milliseconds timeout_;
};

/// Polls GET /v1/events?after=<cursor> and hands events out one at a time
class HttpEventSource : public EventSource {
public:
    HttpEventSource(ChainId chain_id, std::string base_url, uint64_t cursor = 0);

    ChainId chain_id() const override { return chain_id_; }
    std::optional<ChainEvent> next(std::chrono::milliseconds timeout) override;
    bool closed() const override { return closed_.load(); }

    void close() { closed_.store(true); }
    uint64_t cursor() const;

private:
    ChainId chain_id_;
    std::string base_url_;
    std::deque<ChainEvent> buffer_;
    uint64_t cursor_;
    mutable std::mutex mutex_;
    std::atomic<bool> closed_{false};

    void poll(std::chrono::milliseconds timeout);
};

} // namespace launchpad
