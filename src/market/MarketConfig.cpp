#include "market/MarketConfig.hpp"

#include "nlohmann/json.hpp"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace market {

bool MarketConfig::is_configured() const {
    return client_id != kPlaceholderClientId && client_secret != kPlaceholderClientSecret;
}

std::string MarketConfig::oauth_url() const {
    return environment == Environment::Sandbox
        ? "https://api.sandbox.ebay.com/identity/v1/oauth2/token"
        : "https://api.ebay.com/identity/v1/oauth2/token";
}

std::string MarketConfig::browse_search_url() const {
    return environment == Environment::Sandbox
        ? "https://api.sandbox.ebay.com/buy/browse/v1/item_summary/search"
        : "https://api.ebay.com/buy/browse/v1/item_summary/search";
}

const char* environment_str(Environment env) {
    switch (env) {
        case Environment::Sandbox: return "SANDBOX";
        case Environment::Production: return "PRODUCTION";
    }
    return "PRODUCTION";
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

MarketConfig load_market_config(const std::filesystem::path& path) {
    MarketConfig cfg;

    std::ifstream in(path);
    if (!in) return cfg;

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("invalid JSON in " + path.string() + ": " + e.what());
    }

    const std::string where = path.filename().string();
    if (!j.is_object()) throw std::runtime_error(where + " must be an object");

    cfg.client_id = require_string(j, "client_id", where);
    cfg.client_secret = require_string(j, "client_secret", where);

    if (j.contains("environment")) {
        const std::string env = require_string(j, "environment", where);
        if (env == "SANDBOX") cfg.environment = Environment::Sandbox;
        else if (env == "PRODUCTION") cfg.environment = Environment::Production;
        else throw std::runtime_error(where + ".environment must be PRODUCTION or SANDBOX, got: " + env);
    }

    cfg.loaded_from_file = true;
    return cfg;
}

} // namespace market
