// Torch Market Core - Quotes Implementation

#include <torch/market/quotes.hpp>
#include <torch/market/log.hpp>
#include <string>

namespace torch::market {

namespace {

void require_bonding(const BondingCurveState& curve) {
    if (curve.status() != TokenStatus::Bonding) {
        log::logger()->warn("quote rejected for {}: curve is {}",
                            curve.mint.to_base58(), to_string(curve.status()));
        throw CurveComplete("Bonding curve complete, trade on DEX");
    }
}

}  // namespace

void validate_slippage(uint16_t slippage_bps) {
    if (slippage_bps < MIN_SLIPPAGE_BPS || slippage_bps > MAX_SLIPPAGE_BPS) {
        throw InvalidSlippage(
            "slippage_bps must be between " + std::to_string(MIN_SLIPPAGE_BPS) +
            " and " + std::to_string(MAX_SLIPPAGE_BPS) + ", got " + std::to_string(slippage_bps));
    }
}

uint64_t apply_slippage(uint64_t amount, uint16_t slippage_bps) {
    if (slippage_bps > BPS_DENOMINATOR) {
        throw InvalidSlippage("slippage_bps " + std::to_string(slippage_bps) + " exceeds 100%");
    }
    return math::mul_div(amount, BPS_DENOMINATOR - slippage_bps, BPS_DENOMINATOR);
}

BuyQuote buy_quote(
    const BondingCurveState& curve, uint64_t sol_amount,
    const FeeConfig& fees, uint16_t slippage_bps) {
    require_bonding(curve);
    validate_slippage(slippage_bps);
    if (sol_amount < MIN_SOL_AMOUNT) {
        throw AmountTooSmall(
            "Buy amount " + std::to_string(sol_amount) + " below minimum " +
            std::to_string(MIN_SOL_AMOUNT) + " lamports");
    }

    FeeConfig effective = fees;
    effective.bonding_target = curve.bonding_target;

    const auto& reserves = curve.reserves;
    BuyQuote quote;
    quote.input_sol = sol_amount;
    quote.breakdown = math::calculate_tokens_out(sol_amount, reserves, effective);

    const auto& r = quote.breakdown;
    double price_before = math::calculate_price(reserves.virtual_sol, reserves.virtual_token);
    double price_after = math::calculate_price(
        math::checked_add(reserves.virtual_sol, r.sol_to_curve),
        math::checked_sub(reserves.virtual_token, r.tokens_out));

    quote.price_per_token_sol = math::price_per_token_sol(price_before);
    quote.price_impact_percent = (price_after - price_before) / price_before * 100.0;
    quote.min_output_tokens = apply_slippage(r.tokens_to_user, slippage_bps);
    quote.will_complete_bonding =
        math::checked_add(reserves.real_sol, r.sol_to_curve) >=
        math::resolve_bonding_target(curve.bonding_target);

    log::logger()->debug("buy quote {}: {} lamports -> {} tokens to user (min {}, rate {} bps)",
                         curve.mint.to_base58(), sol_amount, r.tokens_to_user,
                         quote.min_output_tokens, r.treasury_rate_bps);
    return quote;
}

SellQuote sell_quote(
    const BondingCurveState& curve, uint64_t token_amount, uint16_t slippage_bps) {
    require_bonding(curve);
    validate_slippage(slippage_bps);

    const auto& reserves = curve.reserves;
    math::SellResult r = math::calculate_sol_out(token_amount, reserves);

    double price_before = math::calculate_price(reserves.virtual_sol, reserves.virtual_token);
    double price_after = math::calculate_price(
        math::checked_sub(reserves.virtual_sol, r.sol_out),
        math::checked_add(reserves.virtual_token, token_amount));

    SellQuote quote;
    quote.input_tokens = token_amount;
    quote.output_sol = r.sol_to_user;
    quote.protocol_fee_sol = 0;
    quote.price_per_token_sol = math::price_per_token_sol(price_before);
    quote.price_impact_percent = (price_before - price_after) / price_before * 100.0;
    quote.min_output_sol = apply_slippage(r.sol_to_user, slippage_bps);

    log::logger()->debug("sell quote {}: {} tokens -> {} lamports (min {})",
                         curve.mint.to_base58(), token_amount, quote.output_sol, quote.min_output_sol);
    return quote;
}

TokenSummary token_summary(const BondingCurveState& curve) {
    const auto& reserves = curve.reserves;

    TokenSummary summary;
    summary.mint = curve.mint;
    summary.status = curve.status();
    summary.price_sol = math::price_per_token_sol(
        math::calculate_price(reserves.virtual_sol, reserves.virtual_token));
    summary.circulating_supply =
        math::circulating_supply(reserves.real_token, curve.vote_vault_balance);
    summary.market_cap_sol = math::market_cap_sol(summary.price_sol, summary.circulating_supply);
    summary.progress_percent = math::calculate_bonding_progress(reserves.real_sol);
    summary.sol_raised = reserves.real_sol;
    summary.tokens_burned = curve.permanently_burned_tokens;
    summary.reclaimed = curve.reclaimed;
    return summary;
}

}  // namespace torch::market
