#pragma once

#include "market/MarketClient.hpp"

#include <filesystem>
#include <string>

namespace market {

// Serves canned responses from <root>/<slug>.json, slug = query_slug(req.query).
// Exclusions are applied to titles locally; limit caps the result.
class MockMarketClient final : public MarketClient {
    std::filesystem::path root_;

public:
    explicit MockMarketClient(const std::string& root_dir);

    std::vector<Listing> search(const SearchRequest& req) override;

    std::filesystem::path path_for_query(const std::string& query) const;
};

// "2015 Chevrolet Impala" -> "2015_chevrolet_impala"
std::string query_slug(const std::string& query);

} // namespace market
