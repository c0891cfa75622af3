#include "commands/search.hpp"

#include "market/MarketConfig.hpp"
#include "market/MockMarketClient.hpp"
#include "market/SearchQuery.hpp"

#include <iostream>
#include <string>
#include <vector>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

static std::vector<std::string> get_all_args(int argc, char** argv, const std::string& key) {
    std::vector<std::string> out;
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) out.push_back(argv[++i]);
    }
    return out;
}

static int search_usage() {
    std::cerr
        << "usage:\n"
        << "  yardscan search --query \"<year make model>\" [options]\n"
        << "\n"
        << "options:\n"
        << "  --exclude <word>             repeatable; words of 2 chars or fewer are ignored\n"
        << "  --limit <n>                  default: 20\n"
        << "  --config <path>              default: config/market.json\n"
        << "  --mock <dir>                 serve results from <dir>/<query_slug>.json\n";
    return 2;
}

int cmd_search(int argc, char** argv) {
    const std::string query       = get_arg(argc, argv, "--query", "");
    const std::string config_path = get_arg(argc, argv, "--config", "config/market.json");
    const std::string mock_dir    = get_arg(argc, argv, "--mock", "");
    const std::string limit_s     = get_arg(argc, argv, "--limit", "20");

    if (query.empty()) {
        std::cerr << "error: missing --query\n";
        return search_usage();
    }

    market::ExclusionList excludes;
    for (const auto& w : get_all_args(argc, argv, "--exclude")) {
        if (!excludes.add(w) && !excludes.contains(w)) {
            std::cerr << "warning: ignoring short exclusion word: " << w << "\n";
        }
    }

    market::SearchRequest req;
    req.query = query;
    req.exclude_keywords = excludes.words();
    try {
        req.limit = std::stoi(limit_s);
    } catch (const std::exception&) {
        std::cerr << "error: --limit must be an integer, got: " << limit_s << "\n";
        return 2;
    }
    if (req.limit <= 0) {
        std::cerr << "error: --limit must be positive\n";
        return 2;
    }

    try {
        const market::MarketConfig cfg = market::load_market_config(config_path);
        if (!cfg.loaded_from_file) {
            std::cerr << "warning: " << config_path << " not found, using placeholder credentials\n";
        }

        std::cout << "QUERY: " << req.augmented_query() << "\n";
        std::cout << "ENVIRONMENT: " << market::environment_str(cfg.environment) << "\n";
        std::cout << "URL: " << req.to_url(cfg.browse_search_url()) << "\n";
        std::cout << "MARKETPLACE: " << req.marketplace_id << "\n";

        if (mock_dir.empty()) {
            if (!cfg.is_configured()) {
                std::cerr << "warning: marketplace credentials not configured; update " << config_path << "\n";
            }
            return 0;
        }

        market::MockMarketClient client(mock_dir);
        const auto listings = client.search(req);

        std::cout << "RESULTS: " << listings.size() << "\n";
        if (listings.empty()) {
            std::cerr << "warning: no items found matching your search criteria\n";
        }
        for (size_t i = 0; i < listings.size(); ++i) {
            const auto& l = listings[i];
            std::cout << (i + 1) << ". " << market::format_price(l.price.value) << "  " << l.title;
            if (!l.condition.empty()) std::cout << " (" << l.condition << ")";
            std::cout << "\n";
            if (!l.web_url.empty()) std::cout << "   " << l.web_url << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
