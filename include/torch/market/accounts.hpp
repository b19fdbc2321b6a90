// Torch Market Core - Account Registry
// Every account address the protocol and its Raydium migration target expect.
// Seed order must match the account declarations on-chain exactly.

#pragma once

#include <torch/market/constants.hpp>
#include <torch/market/types.hpp>
#include <optional>

namespace torch::market {

// Order two mints the way Raydium CPMM does: first differing byte decides.
// Identical keys are a caller error and come back unchanged.
TokenPair order_tokens(const Pubkey& a, const Pubkey& b) noexcept;

// Accounts for migrating a mint into a WSOL / mint CPMM pool
struct MigrationAccounts {
    Pubkey token0;
    Pubkey token1;
    bool is_wsol_token0 = false;
    Pubkey amm_authority;
    Pubkey pool_state;
    Pubkey lp_mint;
    Pubkey token0_vault;
    Pubkey token1_vault;
    Pubkey observation_state;
    Pubkey amm_config;        // fixed, not derived
    Pubkey create_pool_fee;   // fixed, not derived
};

// Vault accounts used when a buy or sell routes through a creator vault
struct VaultAccounts {
    Pubkey vault;
    Pubkey wallet_link;
    Pubkey vault_token_account;
};

// Accounts for a buy or sell on the bonding curve
struct TradeAccounts {
    Pubkey global_config;
    Pubkey bonding_curve;
    Pubkey bonding_curve_token_account;
    Pubkey token_treasury;
    Pubkey treasury_token_account;
    Pubkey user_position;
    Pubkey user_stats;
    Pubkey protocol_treasury;
    Pubkey user_token_account;
    std::optional<VaultAccounts> vault;
};

// Stateless derivation service over a fixed set of program ids
class AccountRegistry {
public:
    explicit AccountRegistry(ProgramIds ids = ProgramIds::mainnet());

    [[nodiscard]] const ProgramIds& program_ids() const noexcept { return ids_; }

    // Protocol program
    [[nodiscard]] DerivedAddress global_config() const;
    [[nodiscard]] DerivedAddress bonding_curve(const Pubkey& mint) const;
    [[nodiscard]] DerivedAddress user_position(const Pubkey& bonding_curve, const Pubkey& user) const;
    [[nodiscard]] DerivedAddress vote_record(const Pubkey& bonding_curve, const Pubkey& voter) const;
    [[nodiscard]] DerivedAddress token_treasury(const Pubkey& mint) const;
    [[nodiscard]] DerivedAddress protocol_treasury() const;
    [[nodiscard]] DerivedAddress user_stats(const Pubkey& user) const;
    [[nodiscard]] DerivedAddress star_record(const Pubkey& user, const Pubkey& mint) const;
    [[nodiscard]] DerivedAddress loan_position(const Pubkey& mint, const Pubkey& borrower) const;
    [[nodiscard]] DerivedAddress collateral_vault(const Pubkey& mint) const;
    [[nodiscard]] DerivedAddress creator_vault(const Pubkey& creator) const;
    [[nodiscard]] DerivedAddress vault_wallet_link(const Pubkey& wallet) const;

    // Token-2022 associated token accounts
    [[nodiscard]] Pubkey token_account(const Pubkey& owner, const Pubkey& mint) const;
    [[nodiscard]] Pubkey treasury_token_account(const Pubkey& mint, const Pubkey& treasury) const;
    [[nodiscard]] Pubkey treasury_token_account(const Pubkey& mint) const;

    // Raydium CPMM program
    [[nodiscard]] DerivedAddress amm_authority() const;
    [[nodiscard]] DerivedAddress pool_state(
        const Pubkey& amm_config, const Pubkey& token0, const Pubkey& token1) const;
    [[nodiscard]] DerivedAddress lp_mint(const Pubkey& pool_state) const;
    [[nodiscard]] DerivedAddress pool_vault(const Pubkey& pool_state, const Pubkey& token_mint) const;
    [[nodiscard]] DerivedAddress observation_state(const Pubkey& pool_state) const;

    // Composites
    [[nodiscard]] MigrationAccounts migration_accounts(const Pubkey& mint) const;
    [[nodiscard]] TradeAccounts trade_accounts(
        const Pubkey& mint, const Pubkey& user,
        const std::optional<Pubkey>& vault_creator = std::nullopt) const;

private:
    ProgramIds ids_;
};

}  // namespace torch::market
