// Torch Market Core - Types Implementation

#include <torch/market/types.hpp>
#include <algorithm>
#include <vector>

namespace torch::market {

namespace {

constexpr std::string_view BASE58_ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int base58_digit(char c) noexcept {
    auto pos = BASE58_ALPHABET.find(c);
    return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

// Big-endian base-256 decode; nullopt on a character outside the alphabet
std::optional<std::vector<uint8_t>> base58_decode(std::string_view text) {
    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') ++zeros;

    // log(58) / log(256) ~= 0.733
    std::vector<uint8_t> b256((text.size() - zeros) * 733 / 1000 + 1, 0);
    for (size_t i = zeros; i < text.size(); ++i) {
        int carry = base58_digit(text[i]);
        if (carry < 0) return std::nullopt;
        for (auto it = b256.rbegin(); it != b256.rend(); ++it) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        if (carry != 0) return std::nullopt;
    }

    auto first = std::find_if(b256.begin(), b256.end(), [](uint8_t b) { return b != 0; });
    std::vector<uint8_t> out(zeros, 0);
    out.insert(out.end(), first, b256.end());
    return out;
}

std::string base58_encode(const uint8_t* data, size_t len) {
    size_t zeros = 0;
    while (zeros < len && data[zeros] == 0) ++zeros;

    // log(256) / log(58) ~= 1.366
    std::vector<uint8_t> b58((len - zeros) * 1366 / 1000 + 1, 0);
    for (size_t i = zeros; i < len; ++i) {
        int carry = data[i];
        for (auto it = b58.rbegin(); it != b58.rend(); ++it) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
    }

    auto first = std::find_if(b58.begin(), b58.end(), [](uint8_t b) { return b != 0; });
    std::string out(zeros, '1');
    for (auto it = first; it != b58.end(); ++it) {
        out.push_back(BASE58_ALPHABET[*it]);
    }
    return out;
}

}  // namespace

Pubkey Pubkey::from_base58(std::string_view text) {
    auto decoded = base58_decode(text);
    if (!decoded) {
        throw InvalidKey("Invalid base58 character in key: " + std::string(text));
    }
    if (decoded->size() != SIZE) {
        throw InvalidKey("Key decodes to " + std::to_string(decoded->size()) +
                         " bytes, expected 32: " + std::string(text));
    }
    Bytes bytes{};
    std::copy(decoded->begin(), decoded->end(), bytes.begin());
    return Pubkey(bytes);
}

std::optional<Pubkey> Pubkey::parse(std::string_view text) noexcept {
    try {
        return from_base58(text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string Pubkey::to_base58() const {
    return base58_encode(bytes_.data(), bytes_.size());
}

}  // namespace torch::market
