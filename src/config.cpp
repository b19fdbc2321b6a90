// Torch Market Core - Configuration Implementation

#include <torch/market/config.hpp>
#include <torch/market/log.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace torch::market {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing "# comment" outside of quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

uint64_t parse_u64(const std::string& key, const std::string& value, uint64_t max) {
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
        throw ConfigError("Invalid number for " + key + ": '" + value + "'");
    }
    size_t pos = 0;
    uint64_t parsed = 0;
    try {
        parsed = std::stoull(value, &pos);
    } catch (const std::exception&) {
        throw ConfigError("Invalid number for " + key + ": '" + value + "'");
    }
    if (pos != value.size() || parsed > max) {
        throw ConfigError("Invalid number for " + key + ": '" + value + "'");
    }
    return parsed;
}

uint16_t parse_bps(const std::string& key, const std::string& value) {
    return static_cast<uint16_t>(parse_u64(key, value, std::numeric_limits<uint16_t>::max()));
}

Pubkey parse_key(const std::string& key, const std::string& value) {
    auto parsed = Pubkey::parse(value);
    if (!parsed) {
        throw ConfigError("Invalid public key for " + key + ": '" + value + "'");
    }
    return *parsed;
}

void apply_setting(Config& config, const std::string& section,
                   const std::string& key, const std::string& value) {
    if (section == "general") {
        if (key == "log_level") config.general.log_level = value;
        else if (key == "slippage_bps") config.general.slippage_bps = parse_bps(key, value);
    }
    else if (section == "fees") {
        if (key == "protocol_fee_bps") config.fees.protocol_fee_bps = parse_bps(key, value);
        else if (key == "treasury_fee_bps") config.fees.treasury_fee_bps = parse_bps(key, value);
        else if (key == "bonding_target") {
            config.fees.bonding_target =
                parse_u64(key, value, std::numeric_limits<uint64_t>::max());
        }
    }
    else if (section == "programs") {
        auto& ids = config.programs;
        if (key == "protocol_program") ids.protocol_program = parse_key(key, value);
        else if (key == "amm_program") ids.amm_program = parse_key(key, value);
        else if (key == "amm_config") ids.amm_config = parse_key(key, value);
        else if (key == "amm_create_pool_fee") ids.amm_create_pool_fee = parse_key(key, value);
        else if (key == "wsol_mint") ids.wsol_mint = parse_key(key, value);
        else if (key == "token_2022_program") ids.token_2022_program = parse_key(key, value);
        else if (key == "associated_token_program") ids.associated_token_program = parse_key(key, value);
    }
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    bool is_json = path_str.size() >= 5 && path_str.compare(path_str.size() - 5, 5, ".json") == 0;
    return is_json ? from_json(buffer.str()) : from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header: " + line);
            }
            current_section = trim(line.substr(1, end - 1));
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Expected key = value: " + line);
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));
        apply_setting(config, current_section, key, value);
    }

    config.validate();
    log::logger()->debug("loaded config: slippage {} bps, fees {}/{} bps",
                         config.general.slippage_bps, config.fees.protocol_fee_bps,
                         config.fees.treasury_fee_bps);
    return config;
}

Config Config::from_json(std::string_view content) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Malformed JSON config: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("JSON config must be an object");
    }

    Config config;
    for (const auto& section_item : root.items()) {
        const std::string& section = section_item.key();
        const auto& entries = section_item.value();
        if (!entries.is_object()) {
            throw ConfigError("Section '" + section + "' must be an object");
        }
        for (const auto& entry : entries.items()) {
            const std::string& key = entry.key();
            const auto& value = entry.value();
            if (value.is_string()) {
                apply_setting(config, section, key, value.get<std::string>());
            } else if (value.is_number_unsigned()) {
                apply_setting(config, section, key, std::to_string(value.get<uint64_t>()));
            } else {
                throw ConfigError("Unsupported value for " + section + "." + key + ": " + value.dump());
            }
        }
    }

    config.validate();
    return config;
}

void Config::validate() const {
    if (fees.protocol_fee_bps > BPS_DENOMINATOR) {
        throw ConfigError("protocol_fee_bps exceeds " + std::to_string(BPS_DENOMINATOR));
    }
    if (fees.treasury_fee_bps > BPS_DENOMINATOR) {
        throw ConfigError("treasury_fee_bps exceeds " + std::to_string(BPS_DENOMINATOR));
    }
    if (static_cast<uint32_t>(fees.protocol_fee_bps) + fees.treasury_fee_bps > BPS_DENOMINATOR) {
        throw ConfigError("protocol_fee_bps + treasury_fee_bps exceeds " +
                          std::to_string(BPS_DENOMINATOR));
    }
    if (general.slippage_bps < MIN_SLIPPAGE_BPS || general.slippage_bps > MAX_SLIPPAGE_BPS) {
        throw ConfigError("slippage_bps must be between " + std::to_string(MIN_SLIPPAGE_BPS) +
                          " and " + std::to_string(MAX_SLIPPAGE_BPS));
    }
}

}  // namespace torch::market
