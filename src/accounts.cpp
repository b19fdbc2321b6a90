// Torch Market Core - Account Registry Implementation

#include <torch/market/accounts.hpp>
#include <torch/market/log.hpp>
#include <torch/market/pda.hpp>
#include <utility>

namespace torch::market {

using pda::find_program_address;
using pda::seed;

TokenPair order_tokens(const Pubkey& a, const Pubkey& b) noexcept {
    const auto& a_bytes = a.bytes();
    const auto& b_bytes = b.bytes();
    for (size_t i = 0; i < Pubkey::SIZE; ++i) {
        if (a_bytes[i] < b_bytes[i]) return {a, b, true};
        if (a_bytes[i] > b_bytes[i]) return {b, a, false};
    }
    return {a, b, true};
}

AccountRegistry::AccountRegistry(ProgramIds ids) : ids_(std::move(ids)) {}

// =============================================================================
// Protocol program
// =============================================================================

DerivedAddress AccountRegistry::global_config() const {
    return find_program_address({seed(seeds::GLOBAL_CONFIG)}, ids_.protocol_program);
}

DerivedAddress AccountRegistry::bonding_curve(const Pubkey& mint) const {
    return find_program_address({seed(seeds::BONDING_CURVE), seed(mint)}, ids_.protocol_program);
}

DerivedAddress AccountRegistry::user_position(const Pubkey& bonding_curve, const Pubkey& user) const {
    return find_program_address(
        {seed(seeds::USER_POSITION), seed(bonding_curve), seed(user)}, ids_.protocol_program);
}

DerivedAddress AccountRegistry::vote_record(const Pubkey& bonding_curve, const Pubkey& voter) const {
    return find_program_address(
        {seed(seeds::VOTE), seed(bonding_curve), seed(voter)}, ids_.protocol_program);
}

DerivedAddress AccountRegistry::token_treasury(const Pubkey& mint) const {
    return find_program_address({seed(seeds::TREASURY), seed(mint)}, ids_.protocol_program);
}

DerivedAddress AccountRegistry::protocol_treasury() const {
    return find_program_address({seed(seeds::PROTOCOL_TREASURY)}, ids_.protocol_program);
}

DerivedAddress AccountRegistry::user_stats(const Pubkey& user) const {
    return find_program_address({seed(seeds::USER_STATS), seed(user)}, ids_.protocol_program);
}

// Stars are per token: user first, then mint
DerivedAddress AccountRegistry::star_record(const Pubkey& user, const Pubkey& mint) const {
    return find_program_address(
        {seed(seeds::STAR_RECORD), seed(user), seed(mint)}, ids_.protocol_program);
}

// Loans are keyed mint first, then borrower
DerivedAddress AccountRegistry::loan_position(const Pubkey& mint, const Pubkey& borrower) const {
    return find_program_address(
        {seed(seeds::LOAN), seed(mint), seed(borrower)}, ids_.protocol_program);
}

DerivedAddress AccountRegistry::collateral_vault(const Pubkey& mint) const {
    return find_program_address({seed(seeds::COLLATERAL_VAULT), seed(mint)}, ids_.protocol_program);
}

DerivedAddress AccountRegistry::creator_vault(const Pubkey& creator) const {
    return find_program_address({seed(seeds::TORCH_VAULT), seed(creator)}, ids_.protocol_program);
}

DerivedAddress AccountRegistry::vault_wallet_link(const Pubkey& wallet) const {
    return find_program_address({seed(seeds::VAULT_WALLET_LINK), seed(wallet)}, ids_.protocol_program);
}

// =============================================================================
// Associated token accounts
// =============================================================================

Pubkey AccountRegistry::token_account(const Pubkey& owner, const Pubkey& mint) const {
    return pda::get_associated_token_address(
        owner, mint, ids_.token_2022_program, ids_.associated_token_program).address;
}

Pubkey AccountRegistry::treasury_token_account(const Pubkey& mint, const Pubkey& treasury) const {
    return token_account(treasury, mint);
}

Pubkey AccountRegistry::treasury_token_account(const Pubkey& mint) const {
    return treasury_token_account(mint, token_treasury(mint).address);
}

// =============================================================================
// Raydium CPMM
// =============================================================================

DerivedAddress AccountRegistry::amm_authority() const {
    return find_program_address({seed(seeds::AMM_AUTHORITY)}, ids_.amm_program);
}

// token0 / token1 must already be in canonical order
DerivedAddress AccountRegistry::pool_state(
    const Pubkey& amm_config, const Pubkey& token0, const Pubkey& token1) const {
    return find_program_address(
        {seed(seeds::AMM_POOL), seed(amm_config), seed(token0), seed(token1)}, ids_.amm_program);
}

DerivedAddress AccountRegistry::lp_mint(const Pubkey& pool_state) const {
    return find_program_address({seed(seeds::AMM_LP_MINT), seed(pool_state)}, ids_.amm_program);
}

DerivedAddress AccountRegistry::pool_vault(const Pubkey& pool_state, const Pubkey& token_mint) const {
    return find_program_address(
        {seed(seeds::AMM_POOL_VAULT), seed(pool_state), seed(token_mint)}, ids_.amm_program);
}

DerivedAddress AccountRegistry::observation_state(const Pubkey& pool_state) const {
    return find_program_address({seed(seeds::AMM_OBSERVATION), seed(pool_state)}, ids_.amm_program);
}

// =============================================================================
// Composites
// =============================================================================

MigrationAccounts AccountRegistry::migration_accounts(const Pubkey& mint) const {
    TokenPair pair = order_tokens(ids_.wsol_mint, mint);

    MigrationAccounts accounts;
    accounts.token0 = pair.token0;
    accounts.token1 = pair.token1;
    accounts.is_wsol_token0 = pair.is_first_token0;
    accounts.amm_authority = amm_authority().address;
    accounts.pool_state = pool_state(ids_.amm_config, pair.token0, pair.token1).address;
    accounts.lp_mint = lp_mint(accounts.pool_state).address;
    accounts.token0_vault = pool_vault(accounts.pool_state, pair.token0).address;
    accounts.token1_vault = pool_vault(accounts.pool_state, pair.token1).address;
    accounts.observation_state = observation_state(accounts.pool_state).address;
    accounts.amm_config = ids_.amm_config;
    accounts.create_pool_fee = ids_.amm_create_pool_fee;

    log::logger()->debug("migration accounts for {}: pool {} (wsol token0: {})",
                         mint.to_base58(), accounts.pool_state.to_base58(), accounts.is_wsol_token0);
    return accounts;
}

TradeAccounts AccountRegistry::trade_accounts(
    const Pubkey& mint, const Pubkey& user, const std::optional<Pubkey>& vault_creator) const {
    TradeAccounts accounts;
    accounts.global_config = global_config().address;
    accounts.bonding_curve = bonding_curve(mint).address;
    accounts.bonding_curve_token_account = token_account(accounts.bonding_curve, mint);
    accounts.token_treasury = token_treasury(mint).address;
    accounts.treasury_token_account = treasury_token_account(mint, accounts.token_treasury);
    accounts.user_position = user_position(accounts.bonding_curve, user).address;
    accounts.user_stats = user_stats(user).address;
    accounts.protocol_treasury = protocol_treasury().address;
    accounts.user_token_account = token_account(user, mint);

    if (vault_creator) {
        VaultAccounts vault;
        vault.vault = creator_vault(*vault_creator).address;
        vault.wallet_link = vault_wallet_link(user).address;
        vault.vault_token_account = token_account(vault.vault, mint);
        accounts.vault = vault;
    }
    return accounts;
}

}  // namespace torch::market
