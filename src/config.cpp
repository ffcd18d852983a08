// mart - Marketplace Configuration Implementation

#include <mart/config.hpp>
#include <mart/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace mart {

using json = nlohmann::json;

namespace {

Address parse_address(const json& value, const char* field) {
    if (!value.is_string()) {
        throw ConfigError(std::string(field) + ": expected hex address string");
    }
    auto addr = addresses::from_hex(value.get<std::string>());
    if (!addr) {
        throw ConfigError(std::string(field) + ": invalid address '" + value.get<std::string>() + "'");
    }
    return *addr;
}

uint32_t parse_u32(const json& value, const char* field) {
    if (!value.is_number_unsigned()) {
        throw ConfigError(std::string(field) + ": expected unsigned integer");
    }
    auto v = value.get<uint64_t>();
    if (v > UINT32_MAX) {
        throw ConfigError(std::string(field) + ": out of range");
    }
    return static_cast<uint32_t>(v);
}

}  // namespace

int32_t RoyaltySettings::apply(RoyaltyRegistry& registry) const {
    if (!default_receiver) return errors::OK;
    return registry.set_default_royalty(*default_receiver, default_fee);
}

MarketConfig MarketConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

MarketConfig MarketConfig::from_json(std::string_view content) {
    json doc;
    try {
        doc = json::parse(std::string(content));
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Invalid config JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw ConfigError("Config root must be an object");
    }

    MarketConfig config;

    if (doc.contains("market_address")) {
        config.market_address = parse_address(doc["market_address"], "market_address");
        if (addresses::is_zero(config.market_address)) {
            throw ConfigError("market_address: must not be the zero address");
        }
    }

    if (doc.contains("log_level")) {
        if (!doc["log_level"].is_string()) {
            throw ConfigError("log_level: expected string");
        }
        config.log_level = doc["log_level"].get<std::string>();
        if (!loggers::parse_level(config.log_level)) {
            throw ConfigError("log_level: unknown level '" + config.log_level + "'");
        }
    }

    if (doc.contains("guard_scope")) {
        const auto& scope = doc["guard_scope"];
        if (scope == "global") config.guard_scope = GuardScope::GLOBAL;
        else if (scope == "per_asset") config.guard_scope = GuardScope::PER_ASSET;
        else throw ConfigError("guard_scope: expected \"global\" or \"per_asset\"");
    }

    if (doc.contains("explicit_invalidation")) {
        if (!doc["explicit_invalidation"].is_boolean()) {
            throw ConfigError("explicit_invalidation: expected boolean");
        }
        config.explicit_invalidation = doc["explicit_invalidation"].get<bool>();
    }

    if (doc.contains("royalty")) {
        const auto& r = doc["royalty"];
        if (!r.is_object()) {
            throw ConfigError("royalty: expected object");
        }
        if (r.contains("fee_denominator")) {
            config.royalty.fee_denominator = parse_u32(r["fee_denominator"], "royalty.fee_denominator");
            if (config.royalty.fee_denominator == 0) {
                throw ConfigError("royalty.fee_denominator: must be positive");
            }
        }
        if (r.contains("default_receiver")) {
            config.royalty.default_receiver = parse_address(r["default_receiver"], "royalty.default_receiver");
        }
        if (r.contains("default_fee")) {
            config.royalty.default_fee = parse_u32(r["default_fee"], "royalty.default_fee");
        }
        if (config.royalty.default_fee > config.royalty.fee_denominator) {
            throw ConfigError("royalty.default_fee: exceeds fee_denominator");
        }
    }

    return config;
}

}  // namespace mart
