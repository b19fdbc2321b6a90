// Torch Market Core - JSON Serialization Implementation

#include <torch/market/json.hpp>

namespace torch::market {

void to_json(nlohmann::json& j, const Pubkey& key) {
    j = key.to_base58();
}

void to_json(nlohmann::json& j, TokenStatus status) {
    j = to_string(status);
}

void to_json(nlohmann::json& j, const DerivedAddress& derived) {
    j = nlohmann::json{
        {"address", derived.address},
        {"bump", derived.bump},
    };
}

void to_json(nlohmann::json& j, const TokenPair& pair) {
    j = nlohmann::json{
        {"token0", pair.token0},
        {"token1", pair.token1},
        {"is_first_token0", pair.is_first_token0},
    };
}

void to_json(nlohmann::json& j, const BuyQuote& quote) {
    j = nlohmann::json{
        {"input_sol", quote.input_sol},
        {"breakdown", quote.breakdown},
        {"price_per_token_sol", quote.price_per_token_sol},
        {"price_impact_percent", quote.price_impact_percent},
        {"min_output_tokens", quote.min_output_tokens},
        {"will_complete_bonding", quote.will_complete_bonding},
    };
}

void to_json(nlohmann::json& j, const SellQuote& quote) {
    j = nlohmann::json{
        {"input_tokens", quote.input_tokens},
        {"output_sol", quote.output_sol},
        {"protocol_fee_sol", quote.protocol_fee_sol},
        {"price_per_token_sol", quote.price_per_token_sol},
        {"price_impact_percent", quote.price_impact_percent},
        {"min_output_sol", quote.min_output_sol},
    };
}

void to_json(nlohmann::json& j, const TokenSummary& summary) {
    j = nlohmann::json{
        {"mint", summary.mint},
        {"status", summary.status},
        {"price_sol", summary.price_sol},
        {"market_cap_sol", summary.market_cap_sol},
        {"progress_percent", summary.progress_percent},
        {"sol_raised", summary.sol_raised},
        {"circulating_supply", summary.circulating_supply},
        {"tokens_burned", summary.tokens_burned},
        {"reclaimed", summary.reclaimed},
    };
}

void to_json(nlohmann::json& j, const MigrationAccounts& accounts) {
    j = nlohmann::json{
        {"token0", accounts.token0},
        {"token1", accounts.token1},
        {"is_wsol_token0", accounts.is_wsol_token0},
        {"amm_authority", accounts.amm_authority},
        {"pool_state", accounts.pool_state},
        {"lp_mint", accounts.lp_mint},
        {"token0_vault", accounts.token0_vault},
        {"token1_vault", accounts.token1_vault},
        {"observation_state", accounts.observation_state},
        {"amm_config", accounts.amm_config},
        {"create_pool_fee", accounts.create_pool_fee},
    };
}

void to_json(nlohmann::json& j, const VaultAccounts& accounts) {
    j = nlohmann::json{
        {"vault", accounts.vault},
        {"wallet_link", accounts.wallet_link},
        {"vault_token_account", accounts.vault_token_account},
    };
}

void to_json(nlohmann::json& j, const TradeAccounts& accounts) {
    j = nlohmann::json{
        {"global_config", accounts.global_config},
        {"bonding_curve", accounts.bonding_curve},
        {"bonding_curve_token_account", accounts.bonding_curve_token_account},
        {"token_treasury", accounts.token_treasury},
        {"treasury_token_account", accounts.treasury_token_account},
        {"user_position", accounts.user_position},
        {"user_stats", accounts.user_stats},
        {"protocol_treasury", accounts.protocol_treasury},
        {"user_token_account", accounts.user_token_account},
    };
    if (accounts.vault) {
        j["vault"] = *accounts.vault;
    } else {
        j["vault"] = nullptr;
    }
}

namespace math {

void to_json(nlohmann::json& j, const BuyResult& result) {
    j = nlohmann::json{
        {"protocol_fee", result.protocol_fee},
        {"treasury_fee", result.treasury_fee},
        {"sol_after_fees", result.sol_after_fees},
        {"treasury_rate_bps", result.treasury_rate_bps},
        {"sol_to_treasury_split", result.sol_to_treasury_split},
        {"sol_to_curve", result.sol_to_curve},
        {"sol_to_treasury", result.sol_to_treasury},
        {"tokens_out", result.tokens_out},
        {"tokens_to_user", result.tokens_to_user},
        {"tokens_to_community", result.tokens_to_community},
    };
}

void to_json(nlohmann::json& j, const SellResult& result) {
    j = nlohmann::json{
        {"sol_out", result.sol_out},
        {"sol_to_user", result.sol_to_user},
    };
}

}  // namespace math

}  // namespace torch::market
