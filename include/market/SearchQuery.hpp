#pragma once
#include <map>
#include <string>
#include <vector>

namespace market {

// "2015 CHEVROLET IMPALA" + {"seat","mirror"} -> "2015 CHEVROLET IMPALA -seat -mirror"
std::string build_search_query(const std::string& query, const std::vector<std::string>& exclude_keywords);

// Words picked from listing titles to keep out of the next search.
class ExclusionList {
public:
    // lower-case, drop anything that isn't a word character
    static std::string normalize_word(const std::string& word);

    // Adds or removes the normalized word. Words of 2 chars or fewer are ignored.
    // Returns true when the list changed.
    bool toggle(const std::string& word);

    bool add(const std::string& word);
    bool remove(const std::string& word);
    bool contains(const std::string& word) const;

    const std::vector<std::string>& words() const { return m_words; }

private:
    std::vector<std::string> m_words; // insertion order
};

struct SearchRequest {
    std::string query;
    std::vector<std::string> exclude_keywords;
    int limit = 20;
    std::string sort = "price";
    std::string filter = "buyingOptions:{FIXED_PRICE|AUCTION}";
    std::string marketplace_id = "EBAY_US";

    std::string augmented_query() const { return build_search_query(query, exclude_keywords); }

    // q, limit, sort, filter
    std::map<std::string, std::string> to_query_params() const;
    std::string to_url(const std::string& base_url) const;
};

std::string url_encode(const std::string& s);

} // namespace market
