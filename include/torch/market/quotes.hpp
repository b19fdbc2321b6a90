// Torch Market Core - Quotes
// Buy/sell quotes with price impact and slippage bounds, and token summaries

#pragma once

#include <torch/market/constants.hpp>
#include <torch/market/math.hpp>
#include <torch/market/types.hpp>
#include <cstdint>

namespace torch::market {

struct BuyQuote {
    uint64_t input_sol = 0;
    math::BuyResult breakdown;
    double price_per_token_sol = 0.0;   // before the trade
    double price_impact_percent = 0.0;
    uint64_t min_output_tokens = 0;     // slippage bound on tokens_to_user
    bool will_complete_bonding = false;
};

struct SellQuote {
    uint64_t input_tokens = 0;
    uint64_t output_sol = 0;
    uint64_t protocol_fee_sol = 0;      // always zero, sells are fee free
    double price_per_token_sol = 0.0;
    double price_impact_percent = 0.0;
    uint64_t min_output_sol = 0;
};

struct TokenSummary {
    Pubkey mint;
    TokenStatus status = TokenStatus::Bonding;
    double price_sol = 0.0;
    double market_cap_sol = 0.0;
    double progress_percent = 0.0;
    uint64_t sol_raised = 0;
    uint64_t circulating_supply = 0;
    uint64_t tokens_burned = 0;
    bool reclaimed = false;  // reclaimed curves are hidden from listings
};

// Throws InvalidSlippage outside [MIN_SLIPPAGE_BPS, MAX_SLIPPAGE_BPS]
void validate_slippage(uint16_t slippage_bps);

// amount * (10000 - slippage_bps) / 10000
uint64_t apply_slippage(uint64_t amount, uint16_t slippage_bps);

// Fee bps come from fees, the bonding target from the curve account.
// Throws CurveComplete, AmountTooSmall, InvalidSlippage or any math error
BuyQuote buy_quote(
    const BondingCurveState& curve,
    uint64_t sol_amount,
    const FeeConfig& fees = FeeConfig{},
    uint16_t slippage_bps = DEFAULT_SLIPPAGE_BPS);

// Throws CurveComplete, InvalidSlippage or any math error
SellQuote sell_quote(
    const BondingCurveState& curve,
    uint64_t token_amount,
    uint16_t slippage_bps = DEFAULT_SLIPPAGE_BPS);

TokenSummary token_summary(const BondingCurveState& curve);

}  // namespace torch::market
