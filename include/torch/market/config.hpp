// Torch Market Core - Configuration
// Builder pattern for fluent configuration

#pragma once

#include <torch/market/constants.hpp>
#include <torch/market/types.hpp>
#include <string>
#include <string_view>
#include <utility>

namespace torch::market {

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg) : Error(msg) {}
};

// General settings
struct GeneralConfig {
    std::string log_level = "info";
    uint16_t slippage_bps = DEFAULT_SLIPPAGE_BPS;
};

// Main configuration
class Config {
public:
    GeneralConfig general;
    FeeConfig fees;
    ProgramIds programs = ProgramIds::mainnet();

    Config() = default;

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Load from JSON string, same sections and keys as TOML
    static Config from_json(std::string_view content);

    // Throws ConfigError on out-of-range fees or slippage, or fees summing past 100%
    void validate() const;

    // Builder methods
    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& set_slippage(uint16_t bps) {
        general.slippage_bps = bps;
        return *this;
    }

    Config& set_fees(uint16_t protocol_bps, uint16_t treasury_bps) {
        fees.protocol_fee_bps = protocol_bps;
        fees.treasury_fee_bps = treasury_bps;
        return *this;
    }

    // Only direct math::calculate_tokens_out calls read this. Quotes take the
    // target from the curve account.
    Config& set_bonding_target(uint64_t lamports) {
        fees.bonding_target = lamports;
        return *this;
    }

    Config& with_programs(ProgramIds ids) {
        programs = std::move(ids);
        return *this;
    }
};

}  // namespace torch::market
