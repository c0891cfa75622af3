#pragma once
#include <filesystem>
#include <string>

namespace market {

constexpr const char* kPlaceholderClientId = "YOUR_CLIENT_ID_HERE";
constexpr const char* kPlaceholderClientSecret = "YOUR_CLIENT_SECRET_HERE";

enum class Environment { Production, Sandbox };

struct MarketConfig {
    std::string client_id = kPlaceholderClientId;
    std::string client_secret = kPlaceholderClientSecret;
    Environment environment = Environment::Production;

    bool loaded_from_file = false;

    // false while either credential is still a placeholder
    bool is_configured() const;

    std::string oauth_url() const;
    std::string browse_search_url() const;
};

// Missing file -> placeholder config (loaded_from_file=false).
// Present but malformed -> std::runtime_error.
MarketConfig load_market_config(const std::filesystem::path& path);

const char* environment_str(Environment env);

} // namespace market
