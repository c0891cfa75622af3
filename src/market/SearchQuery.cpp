#include "market/SearchQuery.hpp"

#include <algorithm>
#include <cctype>

namespace market {

std::string build_search_query(const std::string& query, const std::vector<std::string>& exclude_keywords) {
    std::string out = query;
    for (const auto& kw : exclude_keywords) {
        out += " -";
        out += kw;
    }
    return out;
}

std::string ExclusionList::normalize_word(const std::string& word) {
    std::string out;
    out.reserve(word.size());
    for (unsigned char c : word) {
        if (std::isalnum(c) || c == '_') out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool ExclusionList::contains(const std::string& word) const {
    const std::string w = normalize_word(word);
    return std::find(m_words.begin(), m_words.end(), w) != m_words.end();
}

bool ExclusionList::add(const std::string& word) {
    const std::string w = normalize_word(word);
    if (w.size() <= 2) return false;
    if (std::find(m_words.begin(), m_words.end(), w) != m_words.end()) return false;
    m_words.push_back(w);
    return true;
}

bool ExclusionList::remove(const std::string& word) {
    const std::string w = normalize_word(word);
    auto it = std::find(m_words.begin(), m_words.end(), w);
    if (it == m_words.end()) return false;
    m_words.erase(it);
    return true;
}

bool ExclusionList::toggle(const std::string& word) {
    if (normalize_word(word).size() <= 2) return false;
    if (contains(word)) return remove(word);
    return add(word);
}

std::string url_encode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

std::map<std::string, std::string> SearchRequest::to_query_params() const {
    return {
        {"q", augmented_query()},
        {"limit", std::to_string(limit)},
        {"sort", sort},
        {"filter", filter},
    };
}

std::string SearchRequest::to_url(const std::string& base_url) const {
    std::string url = base_url;
    char sep = '?';
    for (const auto& kv : to_query_params()) {
        url.push_back(sep);
        url += url_encode(kv.first);
        url.push_back('=');
        url += url_encode(kv.second);
        sep = '&';
    }
    return url;
}

} // namespace market
