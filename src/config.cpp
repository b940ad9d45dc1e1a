// Launchpad - Configuration Implementation

#include "launchpad/config.hpp"
#include "launchpad/errors.hpp"
#include "launchpad/math.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <set>
#include <sstream>

namespace launchpad {

using json = nlohmann::json;

namespace {

U128 amount_or(const json& section, const char* field, U128 fallback) {
    if (!section.contains(field)) return fallback;
    return math::parse_u128(section.at(field).get<std::string>());
}

void read_general(const json& j, GeneralConfig& general) {
    general.log_level = j.value("log_level", general.log_level);
    general.poll_timeout_ms = j.value("poll_timeout_ms", general.poll_timeout_ms);
    general.rebalance_threshold_bps = j.value("rebalance_threshold_bps",
                                              general.rebalance_threshold_bps);
}

void read_curve(const json& j, CurveParams& curve) {
    curve.platform_fee_bps = j.value("platform_fee_bps", curve.platform_fee_bps);
    curve.creator_fee_bps = j.value("creator_fee_bps", curve.creator_fee_bps);
    curve.initial_virtual_eth = amount_or(j, "initial_virtual_eth", curve.initial_virtual_eth);
    curve.initial_virtual_tokens = amount_or(j, "initial_virtual_tokens",
                                             curve.initial_virtual_tokens);
}

void read_retry(const json& j, RetryPolicy& retry) {
    retry.max_attempts = j.value("max_attempts", retry.max_attempts);
    retry.initial_backoff = std::chrono::milliseconds(
        j.value("initial_backoff_ms", static_cast<int64_t>(retry.initial_backoff.count())));
    retry.multiplier = j.value("backoff_multiplier", retry.multiplier);
    retry.max_backoff = std::chrono::milliseconds(
        j.value("max_backoff_ms", static_cast<int64_t>(retry.max_backoff.count())));
    retry.call_timeout = std::chrono::milliseconds(
        j.value("call_timeout_ms", static_cast<int64_t>(retry.call_timeout.count())));
}

}  // namespace

CoordinatorConfig CoordinatorConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ValidationError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

CoordinatorConfig CoordinatorConfig::from_json(std::string_view content) {
    json root = json::parse(content, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw ValidationError("config is not a JSON object");
    }

    CoordinatorConfig config;
    try {
        if (root.contains("general")) read_general(root["general"], config.general);
        if (root.contains("curve")) read_curve(root["curve"], config.curve);
        if (root.contains("retry")) read_retry(root["retry"], config.retry);

        if (root.contains("identity")) {
            const auto& identity = root["identity"];
            config.coordinator = address_from_hex(identity.at("coordinator").get<std::string>());
            config.admin = address_from_hex(identity.at("admin").get<std::string>());
        }

        for (const auto& caller : root.value("allowed_callers", json::array())) {
            config.allowed_callers.push_back(address_from_hex(caller.get<std::string>()));
        }

        for (const auto& c : root.value("chains", json::array())) {
            ChainConfig chain = ChainConfig::create(c.at("chain_id").get<ChainId>(),
                                                    c.value("name", std::string{}));
            chain.relayer_url = c.value("relayer_url", std::string{});
            chain.origin = c.value("origin", false);
            config.chains.push_back(std::move(chain));
        }
    } catch (const json::exception& e) {
        throw ValidationError(std::string("invalid config: ") + e.what());
    }

    config.validate();
    return config;
}

std::optional<ChainConfig> CoordinatorConfig::chain(ChainId id) const {
    for (const auto& c : chains) {
        if (c.chain_id == id) return c;
    }
    return std::nullopt;
}

void CoordinatorConfig::validate() const {
    static const std::set<std::string> levels{"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (levels.count(general.log_level) == 0) {
        throw ValidationError("unknown log level: " + general.log_level);
    }
    if (general.poll_timeout_ms <= 0) {
        throw ValidationError("poll_timeout_ms must be positive");
    }
    if (curve.platform_fee_bps + curve.creator_fee_bps > fees::MAX_TOTAL_FEE_BPS) {
        throw ValidationError("combined fee exceeds maximum", errors::INVALID_FEE);
    }
    if (curve.initial_virtual_eth == 0 || curve.initial_virtual_tokens == 0) {
        throw ValidationError("initial virtual reserves must be positive", errors::INVALID_AMOUNT);
    }
    if (!curve.can_fill()) {
        spdlog::warn("initial_virtual_tokens {} does not exceed the curve supply {}; "
                     "curves will never fill or migrate",
                     math::to_string(curve.initial_virtual_tokens),
                     math::to_string(supply::CURVE_SUPPLY));
    }
    if (retry.max_attempts == 0 || retry.multiplier < 1.0) {
        throw ValidationError("retry policy needs at least one attempt and a multiplier >= 1");
    }

    std::set<ChainId> seen;
    for (const auto& c : chains) {
        if (c.chain_id == 0) {
            throw ValidationError("chain id 0 is reserved", errors::UNSUPPORTED_CHAIN);
        }
        if (!seen.insert(c.chain_id).second) {
            throw ValidationError("duplicate chain " + std::to_string(c.chain_id),
                                  errors::UNSUPPORTED_CHAIN);
        }
    }
}

}  // namespace launchpad
