// Torch Market Core - JSON Serialization
// nlohmann::json adapters for handing results to transaction assembly

#pragma once

#include <torch/market/accounts.hpp>
#include <torch/market/math.hpp>
#include <torch/market/quotes.hpp>
#include <torch/market/types.hpp>
#include <nlohmann/json.hpp>

namespace torch::market {

// Base58 string
void to_json(nlohmann::json& j, const Pubkey& key);

void to_json(nlohmann::json& j, TokenStatus status);
void to_json(nlohmann::json& j, const DerivedAddress& derived);
void to_json(nlohmann::json& j, const TokenPair& pair);
void to_json(nlohmann::json& j, const BuyQuote& quote);
void to_json(nlohmann::json& j, const SellQuote& quote);
void to_json(nlohmann::json& j, const TokenSummary& summary);
void to_json(nlohmann::json& j, const MigrationAccounts& accounts);
void to_json(nlohmann::json& j, const VaultAccounts& accounts);

// "vault" is null unless the trade routes through a creator vault
void to_json(nlohmann::json& j, const TradeAccounts& accounts);

namespace math {

void to_json(nlohmann::json& j, const BuyResult& result);
void to_json(nlohmann::json& j, const SellResult& result);

}  // namespace math

}  // namespace torch::market
