#ifndef LAUNCHPAD_TYPES_HPP
#define LAUNCHPAD_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <functional>

namespace launchpad {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

inline bool is_zero_address(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts an optional "0x" prefix; throws ValidationError on malformed input
Address address_from_hex(std::string_view hex);

// =============================================================================
// Fixed-Point Amounts (18 decimals, base units)
// =============================================================================

using U128 = unsigned __int128;
using I128 = __int128;

constexpr U128 WAD = 1000000000000000000ULL;  // 1e18

// =============================================================================
// Identifiers
// =============================================================================

using LaunchId = uint64_t;  // content-derived, see compute_launch_id()
using ChainId = uint64_t;

// Key of every per-chain record of a launch
struct CurveKey {
    LaunchId launch_id;
    ChainId chain_id;

    uint64_t id() const {
        uint64_t h = launch_id;
        h = h * 31 + chain_id;
        return h;
    }

    bool operator==(const CurveKey& other) const {
        return launch_id == other.launch_id && chain_id == other.chain_id;
    }
    bool operator!=(const CurveKey& other) const { return !(*this == other); }
    bool operator<(const CurveKey& other) const {
        return launch_id < other.launch_id ||
               (launch_id == other.launch_id && chain_id < other.chain_id);
    }
};

struct CurveKeyHash {
    size_t operator()(const CurveKey& key) const noexcept {
        return std::hash<uint64_t>{}(key.id());
    }
};

// =============================================================================
// Supply Constants
// =============================================================================

namespace supply {

// 1,000,000,000 tokens, fixed
constexpr U128 TOTAL_SUPPLY = static_cast<U128>(1000000000ULL) * WAD;
// 800,000,000 tokens sold along the curve
constexpr U128 CURVE_SUPPLY = static_cast<U128>(800000000ULL) * WAD;
// 200,000,000 tokens reserved for the exchange pool at migration
constexpr U128 LIQUIDITY_RESERVE = TOTAL_SUPPLY - CURVE_SUPPLY;

constexpr U128 INITIAL_VIRTUAL_ETH = WAD;                 // 1 ETH
constexpr U128 INITIAL_VIRTUAL_TOKENS = CURVE_SUPPLY;     // 800M tokens

} // namespace supply

// =============================================================================
// Fee Constants (basis points)
// =============================================================================

namespace fees {
constexpr uint32_t BPS_DENOMINATOR = 10000;
constexpr uint32_t DEFAULT_PLATFORM_FEE_BPS = 100;  // 1%
constexpr uint32_t DEFAULT_CREATOR_FEE_BPS = 100;   // 1%
constexpr uint32_t MAX_TOTAL_FEE_BPS = 1000;        // 10%
constexpr uint32_t NO_SLIPPAGE_LIMIT = BPS_DENOMINATOR;
}

} // namespace launchpad

#endif // LAUNCHPAD_TYPES_HPP
