// Torch Market Core - Core Types
// Account keys, reserve snapshots and the error hierarchy

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace torch::market {

// =============================================================================
// Errors
// =============================================================================

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Zero virtual reserve used as a divisor
class InvalidReserves : public Error {
public:
    explicit InvalidReserves(const std::string& msg) : Error(msg) {}
};

class InvalidTarget : public Error {
public:
    explicit InvalidTarget(const std::string& msg) : Error(msg) {}
};

class InvalidFee : public Error {
public:
    explicit InvalidFee(const std::string& msg) : Error(msg) {}
};

class ArithmeticOverflow : public Error {
public:
    explicit ArithmeticOverflow(const std::string& msg) : Error(msg) {}
};

// No bump in [0, 255] produced an off-curve address
class DerivationExhausted : public Error {
public:
    explicit DerivationExhausted(const std::string& msg) : Error(msg) {}
};

class InvalidSeeds : public Error {
public:
    explicit InvalidSeeds(const std::string& msg) : Error(msg) {}
};

class InvalidKey : public Error {
public:
    explicit InvalidKey(const std::string& msg) : Error(msg) {}
};

class CurveComplete : public Error {
public:
    explicit CurveComplete(const std::string& msg) : Error(msg) {}
};

class AmountTooSmall : public Error {
public:
    explicit AmountTooSmall(const std::string& msg) : Error(msg) {}
};

class InvalidSlippage : public Error {
public:
    explicit InvalidSlippage(const std::string& msg) : Error(msg) {}
};

// =============================================================================
// Pubkey
// =============================================================================

// 32-byte account key. Compared byte-wise, most significant byte first.
class Pubkey {
public:
    static constexpr size_t SIZE = 32;
    using Bytes = std::array<uint8_t, SIZE>;

    constexpr Pubkey() noexcept : bytes_{} {}
    constexpr explicit Pubkey(const Bytes& bytes) noexcept : bytes_(bytes) {}

    // Throws InvalidKey on bad characters or a decoding that is not 32 bytes
    static Pubkey from_base58(std::string_view text);
    static std::optional<Pubkey> parse(std::string_view text) noexcept;

    [[nodiscard]] std::string to_base58() const;
    [[nodiscard]] std::string to_string() const { return to_base58(); }

    [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }
    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]] constexpr size_t size() const noexcept { return SIZE; }

    [[nodiscard]] bool is_zero() const noexcept {
        for (uint8_t b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    bool operator==(const Pubkey& rhs) const noexcept { return bytes_ == rhs.bytes_; }
    bool operator!=(const Pubkey& rhs) const noexcept { return bytes_ != rhs.bytes_; }
    bool operator<(const Pubkey& rhs) const noexcept { return bytes_ < rhs.bytes_; }
    bool operator>(const Pubkey& rhs) const noexcept { return rhs.bytes_ < bytes_; }
    bool operator<=(const Pubkey& rhs) const noexcept { return !(rhs < *this); }
    bool operator>=(const Pubkey& rhs) const noexcept { return !(*this < rhs); }

private:
    Bytes bytes_;
};

// =============================================================================
// On-chain snapshots
// =============================================================================

// Reserve fields of a bonding curve account, lamports / token base units
struct ReserveSnapshot {
    uint64_t virtual_sol = 0;
    uint64_t virtual_token = 0;
    uint64_t real_sol = 0;
    uint64_t real_token = 0;
};

// Default buy fees, 1% each
inline constexpr uint16_t PROTOCOL_FEE_BPS = 100;
inline constexpr uint16_t TREASURY_FEE_BPS = 100;

// Fee parameters for a buy. bonding_target == 0 selects the protocol default.
struct FeeConfig {
    uint16_t protocol_fee_bps = PROTOCOL_FEE_BPS;
    uint16_t treasury_fee_bps = TREASURY_FEE_BPS;
    uint64_t bonding_target = 0;
};

// Program derived address and the bump that produced it
struct DerivedAddress {
    Pubkey address;
    uint8_t bump = 0;

    bool operator==(const DerivedAddress& rhs) const noexcept {
        return address == rhs.address && bump == rhs.bump;
    }
    bool operator!=(const DerivedAddress& rhs) const noexcept { return !(*this == rhs); }
};

// Canonically ordered token pair (token0 < token1 by raw bytes)
struct TokenPair {
    Pubkey token0;
    Pubkey token1;
    bool is_first_token0 = true;  // first argument ended up as token0
};

enum class TokenStatus : uint8_t {
    Bonding = 0,
    Complete = 1,
    Migrated = 2
};

inline constexpr const char* to_string(TokenStatus s) noexcept {
    switch (s) {
        case TokenStatus::Bonding: return "bonding";
        case TokenStatus::Complete: return "complete";
        case TokenStatus::Migrated: return "migrated";
    }
    return "unknown";
}

// Decoded subset of the bonding curve account used by quotes and summaries
struct BondingCurveState {
    Pubkey mint;
    ReserveSnapshot reserves;
    uint64_t vote_vault_balance = 0;
    uint64_t permanently_burned_tokens = 0;
    uint64_t bonding_target = 0;
    bool bonding_complete = false;
    bool migrated = false;
    bool reclaimed = false;

    [[nodiscard]] TokenStatus status() const noexcept {
        if (migrated) return TokenStatus::Migrated;
        if (bonding_complete) return TokenStatus::Complete;
        return TokenStatus::Bonding;
    }
};

}  // namespace torch::market
