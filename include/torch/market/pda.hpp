// Torch Market Core - Program Derived Addresses
// SHA-256 seed hashing, ed25519 curve membership and bump search

#pragma once

#include <torch/market/constants.hpp>
#include <torch/market/types.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace torch::market::pda {

using Seed = std::vector<uint8_t>;
using Seeds = std::vector<Seed>;

inline constexpr size_t MAX_SEEDS = 16;
inline constexpr size_t MAX_SEED_LEN = 32;
inline constexpr std::string_view PDA_MARKER = "ProgramDerivedAddress";

inline Seed seed(std::string_view tag) {
    return Seed(tag.begin(), tag.end());
}

inline Seed seed(const Pubkey& key) {
    return Seed(key.bytes().begin(), key.bytes().end());
}

// SHA-256 over the concatenation of all parts
std::array<uint8_t, 32> sha256(const std::vector<std::vector<uint8_t>>& parts);

// True if the bytes decompress to a point on the ed25519 curve
bool is_on_curve(const Pubkey& address);

// Address for seeds that already include the bump.
// Throws InvalidSeeds on bad seed lengths or when the hash lands on the curve.
Pubkey create_program_address(const Seeds& seeds, const Pubkey& program_id);

// Same as create_program_address, but an on-curve result is nullopt
std::optional<Pubkey> try_create_program_address(const Seeds& seeds, const Pubkey& program_id);

// Searches bumps from 255 down to 0 and returns the first off-curve address.
// Throws DerivationExhausted if none exists.
DerivedAddress find_program_address(const Seeds& seeds, const Pubkey& program_id);

// Associated token account of (owner, mint) under the given token program
DerivedAddress get_associated_token_address(
    const Pubkey& owner,
    const Pubkey& mint,
    const Pubkey& token_program = program_ids::TOKEN_2022_PROGRAM,
    const Pubkey& associated_token_program = program_ids::ASSOCIATED_TOKEN_PROGRAM);

}  // namespace torch::market::pda
