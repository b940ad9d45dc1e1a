// =============================================================================
// curve.cpp - Bonding-curve PriceEngine
// Constant-product pricing over virtual reserves, fees carved before the formula
// =============================================================================

#include "launchpad/curve.hpp"
#include "launchpad/errors.hpp"
#include "launchpad/math.hpp"
#include <algorithm>

namespace launchpad {
namespace price_engine {

using math::checked_add;
using math::checked_sub;
using math::mul_div;
using math::mul_div_up;

// =============================================================================
// Quotes
// =============================================================================

U128 quote_buy(const CurveState& state, U128 eth_in) {
    U128 denom = checked_add(state.virtual_eth, eth_in);
    if (denom == 0) {
        throw ArithmeticError("quote_buy: zero ETH reserve", errors::DIVISION_BY_ZERO);
    }
    return mul_div_up(state.virtual_tokens, eth_in, denom);
}

U128 quote_sell(const CurveState& state, U128 tokens_in) {
    U128 denom = checked_add(state.virtual_tokens, tokens_in);
    if (denom == 0) {
        throw ArithmeticError("quote_sell: zero token reserve", errors::DIVISION_BY_ZERO);
    }
    U128 eth_out = mul_div_up(state.virtual_eth, tokens_in, denom);
    return std::min(eth_out, state.virtual_eth);
}

U128 current_price(const CurveState& state) {
    if (state.virtual_tokens == 0) {
        throw ArithmeticError("current_price: zero token reserve", errors::DIVISION_BY_ZERO);
    }
    return mul_div(state.virtual_eth, WAD, state.virtual_tokens);
}

U128 calculate_eth_in(const CurveState& state, U128 tokens_out) {
    if (tokens_out >= state.virtual_tokens) {
        throw ArithmeticError("calculate_eth_in: tokens_out drains the token reserve",
                              errors::RESERVE_UNDERFLOW);
    }
    return mul_div_up(state.virtual_eth, tokens_out, state.virtual_tokens - tokens_out);
}

// =============================================================================
// Fees / Slippage
// =============================================================================

FeeSplit compute_fees(U128 amount, uint32_t platform_fee_bps, uint32_t creator_fee_bps) {
    FeeSplit split;
    split.platform_fee = mul_div(amount, platform_fee_bps, fees::BPS_DENOMINATOR);
    split.creator_fee = mul_div(amount, creator_fee_bps, fees::BPS_DENOMINATOR);
    return split;
}

uint32_t slippage_bps(U128 expected, U128 actual) {
    if (expected == 0 || actual >= expected) return 0;
    return static_cast<uint32_t>(mul_div(expected - actual, fees::BPS_DENOMINATOR, expected));
}

// =============================================================================
// Trades
// =============================================================================

BuyResult apply_buy(const CurveState& state, U128 eth_in, U128 min_tokens_out,
                    uint32_t max_slippage_bps, uint32_t platform_fee_bps) {
    // ---- checks ----
    if (eth_in == 0) {
        throw ValidationError("buy amount must be positive", errors::INVALID_AMOUNT);
    }
    uint32_t fee_bps = platform_fee_bps + state.creator_fee_bps;
    if (fee_bps > fees::MAX_TOTAL_FEE_BPS) {
        throw ValidationError("combined fee exceeds maximum", errors::INVALID_FEE);
    }
    if (state.virtual_eth == 0) {
        throw ArithmeticError("apply_buy: zero ETH reserve", errors::DIVISION_BY_ZERO);
    }
    if (state.total_supply >= supply::CURVE_SUPPLY) {
        throw StateError(errors::CURVE_MIGRATED, "curve supply exhausted");
    }

    BuyResult result{};
    result.fees = compute_fees(eth_in, platform_fee_bps, state.creator_fee_bps);
    result.eth_for_curve = eth_in - result.fees.total();
    result.eth_used = eth_in;
    if (result.eth_for_curve == 0) {
        throw ValidationError("buy amount is consumed entirely by fees", errors::INVALID_AMOUNT);
    }

    result.tokens_out = quote_buy(state, result.eth_for_curve);

    // Clamp at the curve headroom and charge only what the clamped amount costs
    U128 headroom = supply::CURVE_SUPPLY - state.total_supply;
    if (headroom >= state.virtual_tokens) {
        // Headroom cannot be priced; ceiling rounding may still reach the reserve
        if (result.tokens_out >= state.virtual_tokens) {
            result.tokens_out = state.virtual_tokens - 1;
        }
    } else if (result.tokens_out >= headroom) {
        result.tokens_out = headroom;
        result.migration_triggered = true;

        U128 required = calculate_eth_in(state, headroom);
        U128 gross = mul_div_up(required, fees::BPS_DENOMINATOR,
                                fees::BPS_DENOMINATOR - fee_bps);
        if (gross < eth_in) {
            result.eth_used = gross;
            result.fees = compute_fees(gross, platform_fee_bps, state.creator_fee_bps);
            result.eth_for_curve = gross - result.fees.total();
        }
        result.refund = eth_in - result.eth_used;
    }

    if (result.tokens_out == 0) {
        throw ValidationError("buy amount too small to receive tokens", errors::INVALID_AMOUNT);
    }
    if (result.tokens_out < min_tokens_out) {
        throw SlippageExceeded("tokens out " + math::to_string(result.tokens_out) +
                               " below minimum " + math::to_string(min_tokens_out));
    }
    U128 spot_tokens = mul_div(result.eth_for_curve, state.virtual_tokens, state.virtual_eth);
    uint32_t slip = slippage_bps(spot_tokens, result.tokens_out);
    if (slip > max_slippage_bps) {
        throw SlippageExceeded("buy slippage " + std::to_string(slip) +
                               " bps exceeds " + std::to_string(max_slippage_bps) + " bps");
    }

    // ---- effects (on the copy) ----
    result.state = state;
    result.state.virtual_eth = checked_add(state.virtual_eth, result.eth_for_curve);
    result.state.virtual_tokens = checked_sub(state.virtual_tokens, result.tokens_out);
    result.state.total_supply = checked_add(state.total_supply, result.tokens_out);
    return result;
}

SellResult apply_sell(const CurveState& state, U128 tokens_in, U128 min_eth_out,
                      uint32_t max_slippage_bps, uint32_t platform_fee_bps) {
    if (tokens_in == 0) {
        throw ValidationError("sell amount must be positive", errors::INVALID_AMOUNT);
    }
    if (platform_fee_bps > fees::MAX_TOTAL_FEE_BPS) {
        throw ValidationError("platform fee exceeds maximum", errors::INVALID_FEE);
    }
    if (tokens_in > state.total_supply) {
        throw ValidationError("sell exceeds tokens issued by the curve", errors::INVALID_AMOUNT);
    }
    if (state.virtual_tokens == 0) {
        throw ArithmeticError("apply_sell: zero token reserve", errors::DIVISION_BY_ZERO);
    }

    SellResult result{};
    result.eth_from_curve = quote_sell(state, tokens_in);
    // No creator fee on sells
    result.platform_fee = mul_div(result.eth_from_curve, platform_fee_bps, fees::BPS_DENOMINATOR);
    result.eth_out = result.eth_from_curve - result.platform_fee;

    if (result.eth_out < min_eth_out) {
        throw SlippageExceeded("eth out " + math::to_string(result.eth_out) +
                               " below minimum " + math::to_string(min_eth_out));
    }
    U128 spot_eth = mul_div(tokens_in, state.virtual_eth, state.virtual_tokens);
    uint32_t slip = slippage_bps(spot_eth, result.eth_from_curve);
    if (slip > max_slippage_bps) {
        throw SlippageExceeded("sell slippage " + std::to_string(slip) +
                               " bps exceeds " + std::to_string(max_slippage_bps) + " bps");
    }

    result.state = state;
    result.state.virtual_eth = checked_sub(state.virtual_eth, result.eth_from_curve);
    result.state.virtual_tokens = checked_add(state.virtual_tokens, tokens_in);
    result.state.total_supply = state.total_supply - tokens_in;
    return result;
}

// =============================================================================
// Views
// =============================================================================

uint32_t progress_bps(const CurveState& state) {
    if (state.total_supply >= supply::CURVE_SUPPLY) return fees::BPS_DENOMINATOR;
    return static_cast<uint32_t>(
        mul_div(state.total_supply, fees::BPS_DENOMINATOR, supply::CURVE_SUPPLY));
}

U128 market_cap(const CurveState& state) {
    return mul_div(state.total_supply, current_price(state), WAD);
}

} // namespace price_engine
} // namespace launchpad
