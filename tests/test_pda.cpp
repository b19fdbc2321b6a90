// Torch Market Core - PDA Tests

#include <catch2/catch_test_macros.hpp>
#include <torch/market/pda.hpp>

using namespace torch::market;
using namespace torch::market::pda;

namespace {

const Pubkey USDC_MINT = Pubkey::from_base58("EPjFWdd5AufqSyuxhEyYPfHq4GdPktP5djtsAf1rUkWz");
const Pubkey OWNER = Pubkey::from_base58("4Nd1mBQtrMJVYVfKf2PJy9NZUZdTAsp7D4xWLs4gDB4T");
const Pubkey TOKEN_PROGRAM = Pubkey::from_base58("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");

}  // namespace

TEST_CASE("SHA-256", "[pda]") {
    SECTION("Empty input") {
        auto digest = sha256({});
        REQUIRE(digest[0] == 0xe3);
        REQUIRE(digest[1] == 0xb0);
        REQUIRE(digest[31] == 0x55);
    }

    SECTION("Parts are concatenated") {
        REQUIRE(sha256({seed("ab"), seed("c")}) == sha256({seed("abc")}));
        REQUIRE(sha256({seed("abc")})[0] == 0xba);
    }
}

TEST_CASE("Curve membership", "[pda]") {
    SECTION("Ed25519 base point") {
        REQUIRE(is_on_curve(Pubkey::from_base58("6x5SYnLroiN7WYq8NQYU9KHcH4YjpBbwpUfVu3EB7ieH")));
    }

    SECTION("y = 0 decompresses") {
        REQUIRE(is_on_curve(Pubkey{}));
    }

    SECTION("Derived addresses are off the curve") {
        REQUIRE_FALSE(is_on_curve(Pubkey::from_base58("9X6HSgBJ8Nsx3QF5CeBWQ7BE7qgdH3LRZf5sDziSDXyM")));
        REQUIRE_FALSE(is_on_curve(Pubkey::from_base58("GpMZbSM2GgvTKHJirzeGfMFoaZ8UR2X7F4v8vHTvxFbL")));
    }
}

TEST_CASE("Create program address", "[pda]") {
    SECTION("Known bump") {
        Pubkey address = create_program_address(
            {seed(seeds::GLOBAL_CONFIG), Seed{254}}, program_ids::PROTOCOL);
        REQUIRE(address.to_base58() == "BvnpMVgaCTb68sc1AbKDfxcSqjdLyG9LnXjTb2CKf77f");
    }

    SECTION("On-curve candidate is rejected") {
        Seeds on_curve = {seed(seeds::GLOBAL_CONFIG), Seed{255}};
        REQUIRE_FALSE(try_create_program_address(on_curve, program_ids::PROTOCOL).has_value());
        REQUIRE_THROWS_AS(create_program_address(on_curve, program_ids::PROTOCOL), InvalidSeeds);
    }

    SECTION("Seed limits") {
        REQUIRE_THROWS_AS(
            create_program_address({Seed(MAX_SEED_LEN + 1, 0x01)}, program_ids::PROTOCOL), InvalidSeeds);
        REQUIRE_THROWS_AS(
            create_program_address(Seeds(MAX_SEEDS + 1, Seed{1}), program_ids::PROTOCOL), InvalidSeeds);
        REQUIRE_THROWS_AS(
            find_program_address(Seeds(MAX_SEEDS, Seed{1}), program_ids::PROTOCOL), InvalidSeeds);
    }
}

TEST_CASE("Find program address", "[pda]") {
    SECTION("Highest valid bump wins") {
        auto global = find_program_address({seed(seeds::GLOBAL_CONFIG)}, program_ids::PROTOCOL);
        REQUIRE(global.address.to_base58() == "BvnpMVgaCTb68sc1AbKDfxcSqjdLyG9LnXjTb2CKf77f");
        REQUIRE(global.bump == 254);
    }

    SECTION("Per-mint seed") {
        auto curve = find_program_address(
            {seed(seeds::BONDING_CURVE), seed(USDC_MINT)}, program_ids::PROTOCOL);
        REQUIRE(curve.address.to_base58() == "9X6HSgBJ8Nsx3QF5CeBWQ7BE7qgdH3LRZf5sDziSDXyM");
        REQUIRE(curve.bump == 255);
    }

    SECTION("Result recreates with its bump") {
        Seeds base = {seed(seeds::USER_STATS), seed(OWNER)};
        auto found = find_program_address(base, program_ids::PROTOCOL);
        Seeds with_bump = base;
        with_bump.push_back(Seed{found.bump});
        REQUIRE(create_program_address(with_bump, program_ids::PROTOCOL) == found.address);
    }

    SECTION("Deterministic") {
        Seeds s = {seed(seeds::TREASURY), seed(USDC_MINT)};
        REQUIRE(find_program_address(s, program_ids::PROTOCOL) ==
                find_program_address(s, program_ids::PROTOCOL));
    }

    SECTION("Program id separates namespaces") {
        Seeds s = {seed(seeds::GLOBAL_CONFIG)};
        REQUIRE(find_program_address(s, program_ids::PROTOCOL).address !=
                find_program_address(s, program_ids::RAYDIUM_CPMM).address);
    }
}

TEST_CASE("Associated token address", "[pda]") {
    SECTION("Token-2022 by default") {
        auto ata = get_associated_token_address(OWNER, USDC_MINT);
        REQUIRE(ata.address.to_base58() == "9sNXVj6pS2BrtPCbHYetjf7o3fntZayo4XUS3aDwRwzi");
        // 255, 254 and 253 all land on the curve
        REQUIRE(ata.bump == 252);
    }

    SECTION("Token program changes the address") {
        auto classic = get_associated_token_address(OWNER, USDC_MINT, TOKEN_PROGRAM);
        REQUIRE(classic.address.to_base58() == "3n4sqippT1FN3vh17nrqqtmMBdNEwzPrPnVgJ4aqbPPJ");
    }
}
