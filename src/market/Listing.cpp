#include "market/Listing.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace market {

std::string format_price(const std::string& value) {
    const char* begin = value.c_str();
    char* end = nullptr;
    const double v = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(v)) return "$" + value;

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", std::fabs(v));
    const std::string fixed = buf;

    const size_t dot = fixed.find('.');
    const std::string whole = fixed.substr(0, dot);
    std::string grouped;
    for (size_t i = 0; i < whole.size(); ++i) {
        if (i > 0 && (whole.size() - i) % 3 == 0) grouped.push_back(',');
        grouped.push_back(whole[i]);
    }

    return std::string(v < 0 ? "-$" : "$") + grouped + fixed.substr(dot);
}

static std::string opt_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return "";
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static Price parse_price(const json& j, const std::string& where) {
    Price p;
    if (!j.is_object()) throw std::runtime_error(where + " must be an object");
    p.value = opt_string(j, "value", where);
    p.currency = opt_string(j, "currency", where);
    return p;
}

static Listing parse_listing(const json& j, const std::string& where) {
    if (!j.is_object()) throw std::runtime_error(where + " must be an object");

    Listing l;
    l.item_id   = opt_string(j, "itemId", where);
    l.title     = opt_string(j, "title", where);
    l.web_url   = opt_string(j, "itemWebUrl", where);
    l.condition = opt_string(j, "condition", where);

    if (j.contains("price")) l.price = parse_price(j.at("price"), where + ".price");

    if (j.contains("image") && j.at("image").is_object()) {
        l.image_url = opt_string(j.at("image"), "imageUrl", where + ".image");
    }

    if (j.contains("seller") && j.at("seller").is_object()) {
        const json& s = j.at("seller");
        l.seller_username = opt_string(s, "username", where + ".seller");
        l.seller_feedback_percentage = opt_string(s, "feedbackPercentage", where + ".seller");
    }

    if (j.contains("shippingOptions") && j.at("shippingOptions").is_array() && !j.at("shippingOptions").empty()) {
        const json& first = j.at("shippingOptions").at(0);
        if (first.is_object() && first.contains("shippingCost")) {
            l.shipping_cost = parse_price(first.at("shippingCost"), where + ".shippingOptions[0].shippingCost");
        }
    }
    return l;
}

std::vector<Listing> listings_from_json(const json& response) {
    std::vector<Listing> out;
    if (!response.is_object()) throw std::runtime_error("search response must be an object");
    if (!response.contains("itemSummaries")) return out;

    const json& items = response.at("itemSummaries");
    if (!items.is_array()) throw std::runtime_error("itemSummaries must be an array");

    out.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        std::ostringstream oss;
        oss << "itemSummaries[" << i << "]";
        out.push_back(parse_listing(items.at(i), oss.str()));
    }
    return out;
}

} // namespace market
