// Torch Market Core - Curve Mathematics Implementation

#include <torch/market/math.hpp>
#include <limits>
#include <string>

namespace torch::market::math {

namespace {

using U128 = unsigned __int128;

constexpr U128 U64_MAX = std::numeric_limits<uint64_t>::max();

uint64_t narrow(U128 value, const char* what) {
    if (value > U64_MAX) {
        throw ArithmeticOverflow(std::string(what) + " exceeds u64 range");
    }
    return static_cast<uint64_t>(value);
}

void require_reserves(uint64_t virtual_sol, uint64_t virtual_token) {
    if (virtual_sol == 0) {
        throw InvalidReserves("virtual_sol_reserves must be positive");
    }
    if (virtual_token == 0) {
        throw InvalidReserves("virtual_token_reserves must be positive");
    }
}

void require_bps(uint16_t bps, const char* name) {
    if (bps > BPS_DENOMINATOR) {
        throw InvalidFee(std::string(name) + " " + std::to_string(bps) +
                         " exceeds " + std::to_string(BPS_DENOMINATOR));
    }
}

}  // namespace

// =============================================================================
// Checked arithmetic
// =============================================================================

uint64_t checked_add(uint64_t a, uint64_t b) {
    return narrow(static_cast<U128>(a) + b, "addition");
}

uint64_t checked_sub(uint64_t a, uint64_t b) {
    if (b > a) {
        throw ArithmeticOverflow(
            "subtraction underflow: " + std::to_string(a) + " - " + std::to_string(b));
    }
    return a - b;
}

uint64_t mul_div(uint64_t a, uint64_t b, uint64_t denominator) {
    U128 product = static_cast<U128>(a) * b;
    return narrow(product / denominator, "mul_div result");
}

// =============================================================================
// Curve Pricing Engine
// =============================================================================

uint16_t treasury_rate_bps(uint64_t real_sol_reserves, uint64_t bonding_target) {
    uint64_t target = resolve_bonding_target(bonding_target);
    if (target == 0) {
        throw InvalidTarget("bonding target resolved to zero");
    }

    constexpr uint64_t range = TREASURY_SOL_MAX_BPS - TREASURY_SOL_MIN_BPS;
    U128 decay = static_cast<U128>(real_sol_reserves) * range / target;

    // max(MAX - decay, MIN) without letting MAX - decay wrap
    if (decay >= range) {
        return TREASURY_SOL_MIN_BPS;
    }
    return static_cast<uint16_t>(TREASURY_SOL_MAX_BPS - static_cast<uint16_t>(decay));
}

BuyResult calculate_tokens_out(
    uint64_t sol_amount, const ReserveSnapshot& reserves, const FeeConfig& fees) {
    require_reserves(reserves.virtual_sol, reserves.virtual_token);
    require_bps(fees.protocol_fee_bps, "protocol_fee_bps");
    require_bps(fees.treasury_fee_bps, "treasury_fee_bps");

    BuyResult r;
    r.protocol_fee = apply_bps(sol_amount, fees.protocol_fee_bps);
    r.treasury_fee = apply_bps(sol_amount, fees.treasury_fee_bps);
    r.sol_after_fees = checked_sub(checked_sub(sol_amount, r.protocol_fee), r.treasury_fee);

    r.treasury_rate_bps = treasury_rate_bps(reserves.real_sol, fees.bonding_target);

    r.sol_to_treasury_split = apply_bps(r.sol_after_fees, r.treasury_rate_bps);
    r.sol_to_curve = r.sol_after_fees - r.sol_to_treasury_split;
    r.sol_to_treasury = checked_add(r.treasury_fee, r.sol_to_treasury_split);

    uint64_t denominator = checked_add(reserves.virtual_sol, r.sol_to_curve);
    r.tokens_out = mul_div(reserves.virtual_token, r.sol_to_curve, denominator);

    r.tokens_to_user = apply_bps(r.tokens_out, USER_TOKEN_SHARE_BPS);
    r.tokens_to_community = r.tokens_out - r.tokens_to_user;

    return r;
}

SellResult calculate_sol_out(
    uint64_t token_amount, uint64_t virtual_sol_reserves, uint64_t virtual_token_reserves) {
    require_reserves(virtual_sol_reserves, virtual_token_reserves);

    uint64_t denominator = checked_add(virtual_token_reserves, token_amount);
    uint64_t sol_out = mul_div(virtual_sol_reserves, token_amount, denominator);

    return {sol_out, sol_out};
}

// =============================================================================
// Progress & Price Utilities
// =============================================================================

double calculate_price(uint64_t virtual_sol_reserves, uint64_t virtual_token_reserves) {
    if (virtual_token_reserves == 0) {
        throw InvalidReserves("virtual_token_reserves must be positive");
    }
    return static_cast<double>(virtual_sol_reserves) / static_cast<double>(virtual_token_reserves);
}

double calculate_bonding_progress(uint64_t real_sol_reserves) noexcept {
    if (real_sol_reserves >= BONDING_TARGET_LAMPORTS) return 100.0;
    return static_cast<double>(real_sol_reserves) / static_cast<double>(BONDING_TARGET_LAMPORTS) * 100.0;
}

uint64_t circulating_supply(uint64_t real_token_reserves, uint64_t vote_vault_balance) {
    return checked_sub(checked_sub(TOTAL_SUPPLY, real_token_reserves), vote_vault_balance);
}

}  // namespace torch::market::math
