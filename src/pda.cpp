// Torch Market Core - Program Derived Address Implementation

#include <torch/market/pda.hpp>
#include <torch/market/log.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/integer.hpp>
#include <openssl/evp.h>
#include <memory>
#include <string>

namespace torch::market::pda {

namespace {

using boost::multiprecision::cpp_int;

// =============================================================================
// Field arithmetic mod 2^255 - 19
// =============================================================================

const cpp_int& field_prime() {
    static const cpp_int p = (cpp_int(1) << 255) - 19;
    return p;
}

// Edwards d = -121665 / 121666
const cpp_int& edwards_d() {
    static const cpp_int d = [] {
        const cpp_int& p = field_prime();
        cpp_int exponent = p - 2;
        cpp_int inv = boost::multiprecision::powm(cpp_int(121666), exponent, p);
        return cpp_int(((p - 121665) * inv) % p);
    }();
    return d;
}

// Little-endian field element with the sign bit cleared, reduced mod p
cpp_int load_y(const Pubkey& key) {
    cpp_int y;
    const auto& bytes = key.bytes();
    boost::multiprecision::import_bits(y, bytes.rbegin(), bytes.rend(), 8, true);
    boost::multiprecision::bit_unset(y, 255);
    return y % field_prime();
}

void check_seeds(const Seeds& seeds) {
    if (seeds.size() > MAX_SEEDS) {
        throw InvalidSeeds("Too many seeds: " + std::to_string(seeds.size()) +
                           " > " + std::to_string(MAX_SEEDS));
    }
    for (const auto& s : seeds) {
        if (s.size() > MAX_SEED_LEN) {
            throw InvalidSeeds("Seed length " + std::to_string(s.size()) +
                               " exceeds " + std::to_string(MAX_SEED_LEN));
        }
    }
}

Pubkey hash_seeds(const Seeds& seeds, const Pubkey& program_id) {
    std::vector<std::vector<uint8_t>> parts = seeds;
    parts.emplace_back(program_id.bytes().begin(), program_id.bytes().end());
    parts.emplace_back(PDA_MARKER.begin(), PDA_MARKER.end());
    return Pubkey(sha256(parts));
}

}  // namespace

std::array<uint8_t, 32> sha256(const std::vector<std::vector<uint8_t>>& parts) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw Error("SHA-256 digest init failed");
    }
    for (const auto& part : parts) {
        if (!part.empty() && EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
            throw Error("SHA-256 digest update failed");
        }
    }

    std::array<uint8_t, 32> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1 || len != digest.size()) {
        throw Error("SHA-256 digest final failed");
    }
    return digest;
}

// Decompression succeeds iff (y^2 - 1) / (d*y^2 + 1) is a square mod p
bool is_on_curve(const Pubkey& address) {
    const cpp_int& p = field_prime();
    cpp_int y = load_y(address);
    cpp_int yy = (y * y) % p;
    cpp_int u = (yy + p - 1) % p;
    cpp_int v = (edwards_d() * yy + 1) % p;

    if (v == 0) {
        return u == 0;
    }

    static const cpp_int inverse_exponent = field_prime() - 2;
    static const cpp_int euler_exponent = (field_prime() - 1) / 2;

    cpp_int v_inv = boost::multiprecision::powm(v, inverse_exponent, p);
    cpp_int w = (u * v_inv) % p;
    if (w == 0) {
        return true;
    }
    // Euler's criterion
    cpp_int legendre = boost::multiprecision::powm(w, euler_exponent, p);
    return legendre == 1;
}

std::optional<Pubkey> try_create_program_address(const Seeds& seeds, const Pubkey& program_id) {
    check_seeds(seeds);
    Pubkey candidate = hash_seeds(seeds, program_id);
    if (is_on_curve(candidate)) {
        return std::nullopt;
    }
    return candidate;
}

Pubkey create_program_address(const Seeds& seeds, const Pubkey& program_id) {
    auto address = try_create_program_address(seeds, program_id);
    if (!address) {
        throw InvalidSeeds("Derived address lies on the ed25519 curve");
    }
    return *address;
}

DerivedAddress find_program_address(const Seeds& seeds, const Pubkey& program_id) {
    if (seeds.size() >= MAX_SEEDS) {
        throw InvalidSeeds("Too many seeds for bump search: " + std::to_string(seeds.size()));
    }

    Seeds with_bump = seeds;
    with_bump.push_back(Seed{0});

    for (int bump = 255; bump >= 0; --bump) {
        with_bump.back()[0] = static_cast<uint8_t>(bump);
        if (auto address = try_create_program_address(with_bump, program_id)) {
            auto logger = log::logger();
            if (logger->should_log(spdlog::level::trace)) {
                logger->trace("pda {} bump {} under {}",
                              address->to_base58(), bump, program_id.to_base58());
            }
            return {*address, static_cast<uint8_t>(bump)};
        }
    }

    throw DerivationExhausted("No off-curve bump for program " + program_id.to_base58());
}

DerivedAddress get_associated_token_address(
    const Pubkey& owner, const Pubkey& mint,
    const Pubkey& token_program, const Pubkey& associated_token_program) {
    return find_program_address(
        {seed(owner), seed(token_program), seed(mint)}, associated_token_program);
}

}  // namespace torch::market::pda
