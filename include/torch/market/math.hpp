// Torch Market Core - Curve Mathematics
// Constant-product pricing, fee splitting and display utilities.
// Settlement math is integer only and truncates exactly like the program.

#pragma once

#include <torch/market/constants.hpp>
#include <torch/market/types.hpp>
#include <cstdint>

namespace torch::market::math {

// =============================================================================
// Results
// =============================================================================

struct BuyResult {
    uint64_t protocol_fee = 0;
    uint64_t treasury_fee = 0;           // flat fee
    uint64_t sol_after_fees = 0;
    uint16_t treasury_rate_bps = 0;      // dynamic rate applied to sol_after_fees
    uint64_t sol_to_treasury_split = 0;
    uint64_t sol_to_curve = 0;
    uint64_t sol_to_treasury = 0;        // flat fee + dynamic split
    uint64_t tokens_out = 0;
    uint64_t tokens_to_user = 0;
    uint64_t tokens_to_community = 0;
};

struct SellResult {
    uint64_t sol_out = 0;
    uint64_t sol_to_user = 0;  // sells carry no fee
};

// =============================================================================
// Checked arithmetic
// =============================================================================

// All throw ArithmeticOverflow when the result leaves the uint64 range
uint64_t checked_add(uint64_t a, uint64_t b);
uint64_t checked_sub(uint64_t a, uint64_t b);

// floor(a * b / denominator) with a 128-bit intermediate product.
// denominator must be non-zero.
uint64_t mul_div(uint64_t a, uint64_t b, uint64_t denominator);

inline uint64_t apply_bps(uint64_t amount, uint64_t bps) {
    return mul_div(amount, bps, BPS_DENOMINATOR);
}

// =============================================================================
// Curve Pricing Engine
// =============================================================================

inline constexpr uint64_t resolve_bonding_target(uint64_t bonding_target) noexcept {
    return bonding_target == 0 ? BONDING_TARGET_LAMPORTS : bonding_target;
}

// Treasury share of post-fee SOL. Decays linearly from 2000 bps at zero
// progress to 500 bps at the target. Only the floor is clamped.
uint16_t treasury_rate_bps(uint64_t real_sol_reserves, uint64_t bonding_target);

// Tokens out for a SOL input, with the full fee and distribution breakdown
BuyResult calculate_tokens_out(
    uint64_t sol_amount,
    const ReserveSnapshot& reserves,
    const FeeConfig& fees = FeeConfig{});

// SOL out for a token input. Pure inverse constant product, no fee.
SellResult calculate_sol_out(
    uint64_t token_amount,
    uint64_t virtual_sol_reserves,
    uint64_t virtual_token_reserves);

inline SellResult calculate_sol_out(uint64_t token_amount, const ReserveSnapshot& reserves) {
    return calculate_sol_out(token_amount, reserves.virtual_sol, reserves.virtual_token);
}

// =============================================================================
// Progress & Price Utilities (display only)
// =============================================================================

// Lamports per token base unit
double calculate_price(uint64_t virtual_sol_reserves, uint64_t virtual_token_reserves);

// Percent of the fixed 200 SOL target, capped at 100. Ignores per-mint
// bonding targets, as the program's display helper does.
double calculate_bonding_progress(uint64_t real_sol_reserves) noexcept;

// SOL per whole token from a lamports-per-base-unit price
inline double price_per_token_sol(double price) noexcept {
    return price * static_cast<double>(TOKEN_MULTIPLIER) / static_cast<double>(LAMPORTS_PER_SOL);
}

// Tokens held outside the curve and the vote vault
uint64_t circulating_supply(uint64_t real_token_reserves, uint64_t vote_vault_balance);

inline double market_cap_sol(double price_per_token_sol, uint64_t circulating) noexcept {
    return price_per_token_sol * static_cast<double>(circulating) / static_cast<double>(TOKEN_MULTIPLIER);
}

}  // namespace torch::market::math
