// Launchpad - Coordinator Configuration
// Builder pattern for fluent configuration

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "curve.hpp"
#include "retry.hpp"
#include "types.hpp"

namespace launchpad {

// General coordinator settings
struct GeneralConfig {
    std::string log_level = "info";
    int poll_timeout_ms = 250;
    uint32_t rebalance_threshold_bps = 50;   // 0.5% deviation
};

// One chain the coordinator talks to
class ChainConfig {
public:
    ChainId chain_id = 0;
    std::string name;
    std::string relayer_url;
    bool origin = false;

    ChainConfig() = default;

    static ChainConfig create(ChainId id, std::string_view chain_name) {
        ChainConfig cfg;
        cfg.chain_id = id;
        cfg.name = std::string(chain_name);
        return cfg;
    }

    ChainConfig& with_relayer(std::string_view url) {
        relayer_url = std::string(url);
        return *this;
    }

    ChainConfig& as_origin() {
        origin = true;
        return *this;
    }
};

// Main coordinator configuration
class CoordinatorConfig {
public:
    GeneralConfig general;
    CurveParams curve;
    RetryPolicy retry;
    Address coordinator{};                  // caller identity on outbound calls
    Address admin{};                        // allow-list admin
    std::vector<Address> allowed_callers;   // relayers allowed to deliver events
    std::vector<ChainConfig> chains;

    CoordinatorConfig() = default;

    // Load from JSON file
    static CoordinatorConfig from_file(std::string_view path);

    // Load from JSON string
    static CoordinatorConfig from_json(std::string_view content);

    // Builder methods
    CoordinatorConfig& with_chain(ChainConfig cfg) {
        chains.push_back(std::move(cfg));
        return *this;
    }

    CoordinatorConfig& with_identity(const Address& coordinator_id, const Address& admin_id) {
        coordinator = coordinator_id;
        admin = admin_id;
        return *this;
    }

    CoordinatorConfig& allow_caller(const Address& caller) {
        allowed_callers.push_back(caller);
        return *this;
    }

    CoordinatorConfig& with_curve(CurveParams params) {
        curve = params;
        return *this;
    }

    CoordinatorConfig& with_retry(RetryPolicy policy) {
        retry = policy;
        return *this;
    }

    CoordinatorConfig& with_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    [[nodiscard]] std::optional<ChainConfig> chain(ChainId id) const;

    // Throws ValidationError on inconsistent settings
    void validate() const;
};

} // namespace launchpad
