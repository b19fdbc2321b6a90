// Torch Market Core - Basic Example
// Quotes a buy and a sell, then prints the accounts a trade and a migration need

#include <torch/market/accounts.hpp>
#include <torch/market/config.hpp>
#include <torch/market/json.hpp>
#include <torch/market/log.hpp>
#include <torch/market/quotes.hpp>
#include <iostream>

using namespace torch::market;

int main(int argc, char** argv) {
    try {
        // Build configuration, or load one from the first argument
        Config config;
        if (argc > 1) {
            config = Config::from_file(argv[1]);
        } else {
            config.set_log_level("debug").set_slippage(200);
        }
        log::init_logging(config.general.log_level);

        // Snapshot of a freshly launched curve
        BondingCurveState curve;
        curve.mint = Pubkey::from_base58("EPjFWdd5AufqSyuxhEyYPfHq4GdPktP5djtsAf1rUkWz");
        curve.reserves.virtual_sol = INITIAL_VIRTUAL_SOL;
        curve.reserves.virtual_token = INITIAL_VIRTUAL_TOKENS;
        curve.reserves.real_token = INITIAL_VIRTUAL_TOKENS;

        auto buy = buy_quote(curve, LAMPORTS_PER_SOL, config.fees, config.general.slippage_bps);
        std::cout << "Buy 1 SOL:\n" << nlohmann::json(buy).dump(2) << "\n";

        auto sell = sell_quote(curve, buy.breakdown.tokens_to_user, config.general.slippage_bps);
        std::cout << "\nSell it back:\n" << nlohmann::json(sell).dump(2) << "\n";

        std::cout << "\nSummary:\n" << nlohmann::json(token_summary(curve)).dump(2) << "\n";

        // Accounts
        AccountRegistry registry(config.programs);
        auto user = Pubkey::from_base58("4Nd1mBQtrMJVYVfKf2PJy9NZUZdTAsp7D4xWLs4gDB4T");

        std::cout << "\nTrade accounts:\n"
                  << nlohmann::json(registry.trade_accounts(curve.mint, user)).dump(2) << "\n";
        std::cout << "\nMigration accounts:\n"
                  << nlohmann::json(registry.migration_accounts(curve.mint)).dump(2) << "\n";
    } catch (const Error& e) {
        log::logger()->error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
