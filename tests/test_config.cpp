// Torch Market Core - Config Tests

#include <catch2/catch_test_macros.hpp>
#include <torch/market/config.hpp>
#include <torch/market/log.hpp>
#include <cstdio>
#include <fstream>
#include <string>

using namespace torch::market;

TEST_CASE("Config defaults", "[config]") {
    Config config;
    REQUIRE(config.general.log_level == "info");
    REQUIRE(config.general.slippage_bps == DEFAULT_SLIPPAGE_BPS);
    REQUIRE(config.fees.protocol_fee_bps == 100);
    REQUIRE(config.fees.treasury_fee_bps == 100);
    REQUIRE(config.fees.bonding_target == 0);
    REQUIRE(config.programs.protocol_program == program_ids::PROTOCOL);
    REQUIRE(config.programs.wsol_mint == program_ids::WSOL_MINT);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config builder", "[config]") {
    Config config;
    config.set_log_level("debug")
          .set_slippage(250)
          .set_fees(50, 75)
          .set_bonding_target(100'000'000'000ULL);

    REQUIRE(config.general.log_level == "debug");
    REQUIRE(config.general.slippage_bps == 250);
    REQUIRE(config.fees.protocol_fee_bps == 50);
    REQUIRE(config.fees.treasury_fee_bps == 75);
    REQUIRE(config.fees.bonding_target == 100'000'000'000ULL);
}

TEST_CASE("Config from TOML", "[config]") {
    SECTION("All sections") {
        auto config = Config::from_toml(R"(
# torch market
[general]
log_level = "warn"
slippage_bps = 500   # 5%

[fees]
protocol_fee_bps = 0
treasury_fee_bps = 200
bonding_target = 100000000000

[programs]
protocol_program = "CPMMoo8L3F4NbTegBCKVNunggL7H1ZpdTHKxQB5qKP1C"
)");
        REQUIRE(config.general.log_level == "warn");
        REQUIRE(config.general.slippage_bps == 500);
        REQUIRE(config.fees.protocol_fee_bps == 0);
        REQUIRE(config.fees.treasury_fee_bps == 200);
        REQUIRE(config.fees.bonding_target == 100'000'000'000ULL);
        REQUIRE(config.programs.protocol_program == program_ids::RAYDIUM_CPMM);
        REQUIRE(config.programs.amm_program == program_ids::RAYDIUM_CPMM);
    }

    SECTION("Unknown keys are ignored") {
        auto config = Config::from_toml("[general]\ncolor = true\n[extra]\nx = 1\n");
        REQUIRE(config.general.log_level == "info");
    }

    SECTION("Malformed values") {
        REQUIRE_THROWS_AS(Config::from_toml("[fees]\nprotocol_fee_bps = lots\n"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_toml("[fees]\nprotocol_fee_bps = -1\n"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_toml("[fees]\nprotocol_fee_bps = 70000\n"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_toml("[fees]\nbonding_target = 12abc\n"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_toml("[programs]\nwsol_mint = \"nope\"\n"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_toml("[general\n"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_toml("[general]\nlog_level\n"), ConfigError);
    }

    SECTION("Out-of-range settings") {
        REQUIRE_THROWS_AS(Config::from_toml("[fees]\ntreasury_fee_bps = 10001\n"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_toml("[general]\nslippage_bps = 5\n"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_toml("[general]\nslippage_bps = 2000\n"), ConfigError);
    }

    SECTION("Fees may not sum past 100%") {
        REQUIRE_THROWS_AS(
            Config::from_toml("[fees]\nprotocol_fee_bps = 6000\ntreasury_fee_bps = 6000\n"), ConfigError);
        REQUIRE_THROWS_AS(
            Config::from_json(R"({"fees": {"protocol_fee_bps": 6000, "treasury_fee_bps": 6000}})"), ConfigError);
        REQUIRE_THROWS_AS(Config{}.set_fees(6000, 6000).validate(), ConfigError);

        auto config = Config::from_toml("[fees]\nprotocol_fee_bps = 5000\ntreasury_fee_bps = 5000\n");
        REQUIRE(config.fees.protocol_fee_bps + config.fees.treasury_fee_bps == BPS_DENOMINATOR);
    }
}

TEST_CASE("Config from JSON", "[config]") {
    SECTION("Same keys as TOML") {
        auto config = Config::from_json(R"({
            "general": {"log_level": "debug", "slippage_bps": 50},
            "fees": {"treasury_fee_bps": 150},
            "programs": {"amm_config": "DNXgeM9EiiaAbaWvwjHj9fQQLAX5ZsfHyvmYUNRAdNC8"}
        })");
        REQUIRE(config.general.log_level == "debug");
        REQUIRE(config.general.slippage_bps == 50);
        REQUIRE(config.fees.treasury_fee_bps == 150);
        REQUIRE(config.fees.protocol_fee_bps == 100);
        REQUIRE(config.programs.amm_config == program_ids::RAYDIUM_CREATE_POOL_FEE);
    }

    SECTION("Malformed documents") {
        REQUIRE_THROWS_AS(Config::from_json("{"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_json("[]"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_json(R"({"fees": 1})"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_json(R"({"fees": {"protocol_fee_bps": -5}})"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_json(R"({"fees": {"protocol_fee_bps": 1.5}})"), ConfigError);
    }
}

TEST_CASE("Config from file", "[config]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(Config::from_file("/nonexistent/torch.toml"), std::runtime_error);
    }

    SECTION("TOML and JSON by extension") {
        const std::string toml_path = "torch_config_test.toml";
        const std::string json_path = "torch_config_test.json";
        {
            std::ofstream(toml_path) << "[general]\nslippage_bps = 300\n";
            std::ofstream(json_path) << R"({"general": {"slippage_bps": 400}})";
        }
        REQUIRE(Config::from_file(toml_path).general.slippage_bps == 300);
        REQUIRE(Config::from_file(json_path).general.slippage_bps == 400);
        std::remove(toml_path.c_str());
        std::remove(json_path.c_str());
    }
}

TEST_CASE("Log levels", "[config][log]") {
    REQUIRE(log::parse_level("trace") == spdlog::level::trace);
    REQUIRE(log::parse_level("warning") == spdlog::level::warn);
    REQUIRE(log::parse_level("err") == spdlog::level::err);
    REQUIRE(log::parse_level("bogus") == spdlog::level::info);

    log::init_logging("error");
    REQUIRE(log::logger()->level() == spdlog::level::err);
    REQUIRE(spdlog::get(log::LOGGER_NAME) == log::logger());
    log::init_logging("info");
}
