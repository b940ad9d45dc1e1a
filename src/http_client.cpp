// Launchpad - Relayer HTTP Adapters Implementation

#include "launchpad/http_client.hpp"
#include "launchpad/codec.hpp"
#include "launchpad/errors.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <thread>

namespace launchpad {

using json = nlohmann::json;

namespace {

std::string error_text(const cpr::Response& response) {
    json body = json::parse(response.text, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("error") && body["error"].is_string()) {
        return body["error"].get<std::string>();
    }
    return response.text;
}

// Throws for anything but 200/201; `conflict_code` is the StateError for 409
void check_response(const cpr::Response& response, const std::string& what, int32_t conflict_code) {
    if (response.error.code != cpr::ErrorCode::OK) {
        int32_t code = response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT
            ? errors::TIMEOUT : errors::NETWORK_FAILURE;
        throw NetworkError(what + ": " + response.error.message, code);
    }

    const long status = response.status_code;
    if (status == 200 || status == 201) return;

    std::string message = what + ": HTTP " + std::to_string(status) + ": " + error_text(response);
    if (status == 403) throw AuthorizationError(message);
    if (status == 409) throw StateError(conflict_code, message);
    if (status >= 500 || status == 408 || status == 429) throw NetworkError(message);
    throw ValidationError(message);
}

json parse_body(const cpr::Response& response, const std::string& what) {
    json body = json::parse(response.text, nullptr, false);
    if (body.is_discarded()) {
        throw NetworkError(what + ": unparseable response body");
    }
    return body;
}

} // anonymous namespace

// =============================================================================
// HttpChainClient
// =============================================================================

HttpChainClient::HttpChainClient(ChainId chain_id, std::string base_url,
                                 std::chrono::milliseconds timeout)
    : chain_id_(chain_id), base_url_(std::move(base_url)), timeout_(timeout) {
    if (base_url_.empty()) {
        throw ValidationError("relayer url for chain " + std::to_string(chain_id_) + " is empty");
    }
}

DeployedAddresses HttpChainClient::deploy_token(const Address& caller, const DeployRequest& request) {
    const std::string what = "deploy on chain " + std::to_string(chain_id_);
    auto response = cpr::Post(
        cpr::Url{base_url_ + "/v1/deploy"},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{codec::encode_deploy(caller, request).dump()},
        cpr::Timeout{timeout_});

    check_response(response, what, errors::ALREADY_DEPLOYED);
    return codec::decode_addresses(parse_body(response, what));
}

void HttpChainClient::sync_price(const Address& caller, const PriceSync& sync) {
    const std::string what = "sync on chain " + std::to_string(chain_id_);
    auto response = cpr::Post(
        cpr::Url{base_url_ + "/v1/sync"},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{codec::encode_sync(caller, sync).dump()},
        cpr::Timeout{timeout_});

    // A stale seq is accepted and dropped by the relayer, never a 409
    check_response(response, what, errors::STALE_SEQUENCE);
}

DexMigrationResult HttpChainClient::migrate_to_dex(const Address& caller, LaunchId launch_id) {
    const std::string what = "migrate on chain " + std::to_string(chain_id_);
    auto response = cpr::Post(
        cpr::Url{base_url_ + "/v1/migrate"},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{codec::encode_migrate(caller, launch_id).dump()},
        cpr::Timeout{timeout_});

    check_response(response, what, errors::ALREADY_MIGRATED);
    return codec::decode_migration(parse_body(response, what));
}

// =============================================================================
// HttpEventSource
// =============================================================================

HttpEventSource::HttpEventSource(ChainId chain_id, std::string base_url, uint64_t cursor)
    : chain_id_(chain_id), base_url_(std::move(base_url)), cursor_(cursor) {
    if (base_url_.empty()) {
        throw ValidationError("relayer url for chain " + std::to_string(chain_id_) + " is empty");
    }
}

uint64_t HttpEventSource::cursor() const {
    std::lock_guard lock(mutex_);
    return cursor_;
}

void HttpEventSource::poll(std::chrono::milliseconds timeout) {
    const std::string what = "events from chain " + std::to_string(chain_id_);
    auto response = cpr::Get(
        cpr::Url{base_url_ + "/v1/events"},
        cpr::Parameters{{"after", std::to_string(cursor_)}},
        cpr::Timeout{timeout});

    check_response(response, what, errors::STALE_SEQUENCE);
    json body = parse_body(response, what);
    if (!body.contains("events") || !body["events"].is_array()) {
        throw NetworkError(what + ": response has no events array");
    }

    for (const auto& item : body["events"]) {
        try {
            buffer_.push_back(codec::decode_event(item));
        } catch (const ValidationError& e) {
            spdlog::warn("Skipping malformed event from chain {}: {}", chain_id_, e.what());
        }
    }
    if (body.contains("cursor") && body["cursor"].is_number_unsigned()) {
        cursor_ = body["cursor"].get<uint64_t>();
    }
}

std::optional<ChainEvent> HttpEventSource::next(std::chrono::milliseconds timeout) {
    if (closed_.load()) return std::nullopt;

    std::lock_guard lock(mutex_);
    if (buffer_.empty()) {
        poll(timeout);
    }
    if (buffer_.empty()) {
        // Nothing new on the relayer; wait out the poll interval
        std::this_thread::sleep_for(timeout);
        return std::nullopt;
    }

    ChainEvent event = std::move(buffer_.front());
    buffer_.pop_front();
    return event;
}

} // namespace launchpad
