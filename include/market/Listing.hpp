#pragma once
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace market {

struct Price {
    std::string value;    // decimal string as the API sends it
    std::string currency;
};

struct Listing {
    std::string item_id;
    std::string title;
    Price price;
    std::string image_url;     // optional
    std::string web_url;
    std::string condition;     // optional
    std::string seller_username;
    std::string seller_feedback_percentage;
    Price shipping_cost;       // first shipping option, optional
};

// "1234.5" -> "$1,234.50"; non-numeric input is returned as "$" + value
std::string format_price(const std::string& value);

// Parses an item_summary/search response body ({"itemSummaries": [...]}).
// Missing itemSummaries means no results. Throws std::runtime_error on bad types.
std::vector<Listing> listings_from_json(const nlohmann::json& response);

} // namespace market
