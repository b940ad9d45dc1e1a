#ifndef LAUNCHPAD_CURVE_HPP
#define LAUNCHPAD_CURVE_HPP

#include <cstdint>

#include "types.hpp"

namespace launchpad {

// =============================================================================
// Curve Parameters
// =============================================================================

struct CurveParams {
    U128 initial_virtual_eth = supply::INITIAL_VIRTUAL_ETH;
    U128 initial_virtual_tokens = supply::INITIAL_VIRTUAL_TOKENS;
    uint32_t platform_fee_bps = fees::DEFAULT_PLATFORM_FEE_BPS;
    uint32_t creator_fee_bps = fees::DEFAULT_CREATOR_FEE_BPS;

    // A token reserve no deeper than CURVE_SUPPLY is only approached
    // asymptotically, so such a curve never fills and never migrates
    bool can_fill() const { return initial_virtual_tokens > supply::CURVE_SUPPLY; }
};

// =============================================================================
// Curve State (per launch, per chain)
// =============================================================================

struct CurveState {
    U128 virtual_eth;
    U128 virtual_tokens;
    U128 total_supply;         // tokens sold along the curve, <= CURVE_SUPPLY
    uint32_t creator_fee_bps;
    uint64_t last_update_seq;  // seq of the last trade applied

    static CurveState initial(const CurveParams& params) {
        return {params.initial_virtual_eth, params.initial_virtual_tokens, 0,
                params.creator_fee_bps, 0};
    }
};

// =============================================================================
// Trade Results
// =============================================================================

struct FeeSplit {
    U128 platform_fee;
    U128 creator_fee;

    U128 total() const { return platform_fee + creator_fee; }
};

struct BuyResult {
    CurveState state;          // post-trade state
    U128 tokens_out;
    U128 eth_for_curve;        // amount that moved the reserves
    U128 eth_used;             // gross amount consumed (curve + fees)
    U128 refund;               // eth_in - eth_used
    FeeSplit fees;
    bool migration_triggered;
};

struct SellResult {
    CurveState state;
    U128 eth_out;              // net to the seller
    U128 eth_from_curve;       // gross amount leaving the reserves
    U128 platform_fee;
};

// =============================================================================
// PriceEngine - pure functions over a CurveState snapshot
// =============================================================================

namespace price_engine {

// ceil(virtual_tokens * eth_in / (virtual_eth + eth_in))
U128 quote_buy(const CurveState& state, U128 eth_in);

// ceil(virtual_eth * tokens_in / (virtual_tokens + tokens_in)), capped at virtual_eth
U128 quote_sell(const CurveState& state, U128 tokens_in);

// virtual_eth * 1e18 / virtual_tokens
U128 current_price(const CurveState& state);

// Inverse of quote_buy: ceil(virtual_eth * tokens_out / (virtual_tokens - tokens_out))
U128 calculate_eth_in(const CurveState& state, U128 tokens_out);

// Fees round down; both carved out of `amount`
FeeSplit compute_fees(U128 amount, uint32_t platform_fee_bps, uint32_t creator_fee_bps);

// Shortfall of `actual` against `expected`, in bps (0 when actual >= expected)
uint32_t slippage_bps(U128 expected, U128 actual);

BuyResult apply_buy(const CurveState& state, U128 eth_in, U128 min_tokens_out,
                    uint32_t max_slippage_bps,
                    uint32_t platform_fee_bps = fees::DEFAULT_PLATFORM_FEE_BPS);

SellResult apply_sell(const CurveState& state, U128 tokens_in, U128 min_eth_out,
                      uint32_t max_slippage_bps,
                      uint32_t platform_fee_bps = fees::DEFAULT_PLATFORM_FEE_BPS);

// Progress towards CURVE_SUPPLY in bps (10000 = complete)
uint32_t progress_bps(const CurveState& state);

// total_supply * price / 1e18
U128 market_cap(const CurveState& state);

} // namespace price_engine

} // namespace launchpad

#endif // LAUNCHPAD_CURVE_HPP
