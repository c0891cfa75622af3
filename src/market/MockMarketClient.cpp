#include "market/MockMarketClient.hpp"

#include "nlohmann/json.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace market {

std::string query_slug(const std::string& query) {
    std::string out;
    bool pending_sep = false;
    for (unsigned char c : query) {
        if (std::isalnum(c)) {
            if (pending_sep && !out.empty()) out.push_back('_');
            pending_sep = false;
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pending_sep = true;
        }
    }
    return out;
}

static bool title_mentions(const std::string& title, const std::string& keyword) {
    std::string word;
    auto check = [&]() {
        bool hit = !word.empty() && ExclusionList::normalize_word(word) == keyword;
        word.clear();
        return hit;
    };
    for (char c : title) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (check()) return true;
        } else {
            word.push_back(c);
        }
    }
    return check();
}

MockMarketClient::MockMarketClient(const std::string& root_dir) : root_(root_dir) {}

fs::path MockMarketClient::path_for_query(const std::string& query) const {
    return root_ / (query_slug(query) + ".json");
}

std::vector<Listing> MockMarketClient::search(const SearchRequest& req) {
    const fs::path p = path_for_query(req.query);
    std::ifstream f(p);
    if (!f) return {};

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("invalid JSON in " + p.string() + ": " + e.what());
    }

    std::vector<Listing> out;
    for (auto& l : listings_from_json(j)) {
        if (req.limit > 0 && out.size() >= static_cast<size_t>(req.limit)) break;

        bool excluded = false;
        for (const auto& kw : req.exclude_keywords) {
            if (title_mentions(l.title, ExclusionList::normalize_word(kw))) {
                excluded = true;
                break;
            }
        }
        if (!excluded) out.push_back(std::move(l));
    }
    return out;
}

} // namespace market
