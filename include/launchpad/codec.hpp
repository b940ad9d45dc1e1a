#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "chain_client.hpp"
#include "events.hpp"

namespace launchpad::codec {

/// JSON wire format shared by relayers. Amounts travel as decimal strings,
/// addresses as 0x-prefixed hex, events carry a "type" discriminator.
/// Decoding failures throw ValidationError.

nlohmann::json encode_event(const ChainEvent& event);
ChainEvent decode_event(const nlohmann::json& j);

std::string to_wire(const ChainEvent& event);
ChainEvent from_wire(std::string_view text);

nlohmann::json encode_deploy(const Address& caller, const DeployRequest& request);
nlohmann::json encode_sync(const Address& caller, const PriceSync& sync);
nlohmann::json encode_migrate(const Address& caller, LaunchId launch_id);

DeployedAddresses decode_addresses(const nlohmann::json& j);
DexMigrationResult decode_migration(const nlohmann::json& j);

} // namespace launchpad::codec
