// Torch Market Core - Protocol Constants
// Program ids, seed tags and curve economics. Must match the deployed program.

#pragma once

#include <torch/market/types.hpp>
#include <cstdint>
#include <string_view>

namespace torch::market {

// =============================================================================
// Program ids
// =============================================================================

namespace program_ids {

// Torch Market program (mainnet and devnet)
inline const Pubkey PROTOCOL = Pubkey::from_base58("8hbUkonssSEEtkqzwM7ZcZrD9evacM92TcWSooVF4BeT");

// Raydium CPMM, same id on mainnet and devnet
inline const Pubkey RAYDIUM_CPMM = Pubkey::from_base58("CPMMoo8L3F4NbTegBCKVNunggL7H1ZpdTHKxQB5qKP1C");

// Raydium AMM config, 0.25% fee tier. Supplied verbatim, never derived.
inline const Pubkey RAYDIUM_AMM_CONFIG = Pubkey::from_base58("D4FPEruKEHrG5TenZ2mpDGEfu1iUvTiqBxvpU8HLBvC2");

// Raydium pool creation fee receiver
inline const Pubkey RAYDIUM_CREATE_POOL_FEE = Pubkey::from_base58("DNXgeM9EiiaAbaWvwjHj9fQQLAX5ZsfHyvmYUNRAdNC8");

inline const Pubkey WSOL_MINT = Pubkey::from_base58("So11111111111111111111111111111111111111112");

inline const Pubkey TOKEN_2022_PROGRAM = Pubkey::from_base58("TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb");

inline const Pubkey ASSOCIATED_TOKEN_PROGRAM = Pubkey::from_base58("ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL");

}  // namespace program_ids

// Program ids injected into the account registry. Values are fixed per
// deployment and never reassigned after construction.
struct ProgramIds {
    Pubkey protocol_program;
    Pubkey amm_program;
    Pubkey amm_config;
    Pubkey amm_create_pool_fee;
    Pubkey wsol_mint;
    Pubkey token_2022_program;
    Pubkey associated_token_program;

    static ProgramIds mainnet() {
        ProgramIds ids;
        ids.protocol_program = program_ids::PROTOCOL;
        ids.amm_program = program_ids::RAYDIUM_CPMM;
        ids.amm_config = program_ids::RAYDIUM_AMM_CONFIG;
        ids.amm_create_pool_fee = program_ids::RAYDIUM_CREATE_POOL_FEE;
        ids.wsol_mint = program_ids::WSOL_MINT;
        ids.token_2022_program = program_ids::TOKEN_2022_PROGRAM;
        ids.associated_token_program = program_ids::ASSOCIATED_TOKEN_PROGRAM;
        return ids;
    }
};

// =============================================================================
// Seed tags
// =============================================================================

namespace seeds {

inline constexpr std::string_view GLOBAL_CONFIG = "global_config";
inline constexpr std::string_view BONDING_CURVE = "bonding_curve";
inline constexpr std::string_view TREASURY = "treasury";
inline constexpr std::string_view USER_POSITION = "user_position";
inline constexpr std::string_view VOTE = "vote";
inline constexpr std::string_view PROTOCOL_TREASURY = "protocol_treasury_v11";
inline constexpr std::string_view USER_STATS = "user_stats";
inline constexpr std::string_view STAR_RECORD = "star_record";
inline constexpr std::string_view LOAN = "loan";
inline constexpr std::string_view COLLATERAL_VAULT = "collateral_vault";
inline constexpr std::string_view TORCH_VAULT = "torch_vault";
inline constexpr std::string_view VAULT_WALLET_LINK = "vault_wallet";

// Raydium CPMM
inline constexpr std::string_view AMM_AUTHORITY = "vault_and_lp_mint_auth_seed";
inline constexpr std::string_view AMM_POOL = "pool";
inline constexpr std::string_view AMM_LP_MINT = "pool_lp_mint";
inline constexpr std::string_view AMM_POOL_VAULT = "pool_vault";
inline constexpr std::string_view AMM_OBSERVATION = "observation";

}  // namespace seeds

// =============================================================================
// Curve economics
// =============================================================================

inline constexpr uint64_t LAMPORTS_PER_SOL = 1'000'000'000ULL;
inline constexpr int TOKEN_DECIMALS = 6;
inline constexpr uint64_t TOKEN_MULTIPLIER = [] {
    uint64_t multiplier = 1;
    for (int i = 0; i < TOKEN_DECIMALS; ++i) multiplier *= 10;
    return multiplier;
}();

// 1B tokens with 6 decimals
inline constexpr uint64_t TOTAL_SUPPLY = 1'000'000'000ULL * TOKEN_MULTIPLIER;

inline constexpr uint64_t BPS_DENOMINATOR = 10'000;

// Treasury share of post-fee buy SOL, 20% at launch decaying to 5% at completion
inline constexpr uint16_t TREASURY_SOL_MAX_BPS = 2000;
inline constexpr uint16_t TREASURY_SOL_MIN_BPS = 500;

// 90% of bought tokens to the buyer, remainder to the community vote vault
inline constexpr uint16_t USER_TOKEN_SHARE_BPS = 9000;

// 200 SOL
inline constexpr uint64_t BONDING_TARGET_LAMPORTS = 200'000'000'000ULL;

inline constexpr uint64_t INITIAL_VIRTUAL_SOL = 30'000'000'000ULL;
inline constexpr uint64_t INITIAL_VIRTUAL_TOKENS = 107'300'000'000'000ULL;

// 0.001 SOL
inline constexpr uint64_t MIN_SOL_AMOUNT = 1'000'000ULL;

inline constexpr uint16_t DEFAULT_SLIPPAGE_BPS = 100;
inline constexpr uint16_t MIN_SLIPPAGE_BPS = 10;
inline constexpr uint16_t MAX_SLIPPAGE_BPS = 1000;

}  // namespace torch::market
