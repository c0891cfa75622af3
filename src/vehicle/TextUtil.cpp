#include "vehicle/TextUtil.hpp"
#include <cctype>
#include <utility>

namespace textutil {

namespace {

struct Substitution {
    const char* from;
    const char* to;
    bool whole_word;
};

// Applied in this order. No replacement produces text another rule matches.
const Substitution kOcrFixes[] = {
    {"JOI", "201", true},
    {"\xC2\xA7", "2", false},   // §
    {"|", "1", false},
    {"O", "0", true},
};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string replace_all(const std::string& s, const std::string& from, const std::string& to, bool whole_word) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s.compare(i, from.size(), from) == 0) {
            bool bounded = true;
            if (whole_word) {
                const size_t after = i + from.size();
                if (i > 0 && is_word_char(s[i - 1])) bounded = false;
                if (after < s.size() && is_word_char(s[after])) bounded = false;
            }
            if (bounded) {
                out += to;
                i += from.size();
                continue;
            }
        }
        out.push_back(s[i]);
        ++i;
    }
    return out;
}

} // namespace

bool is_word_char(char ch) {
    unsigned char c = static_cast<unsigned char>(ch);
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') ||
           c == '_';
}

std::string fix_ocr_errors(const std::string& raw) {
    std::string fixed = raw;
    for (char& ch : fixed) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c >= 'a' && c <= 'z') ch = static_cast<char>(c - 'a' + 'A');
    }

    for (const auto& sub : kOcrFixes) {
        fixed = replace_all(fixed, sub.from, sub.to, sub.whole_word);
    }
    return fixed;
}

std::string clean(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;

    for (char ch : s) {
        if (is_space(ch)) {
            pending_space = true;
            continue;
        }
        if (!is_word_char(ch) && ch != '-') continue;

        if (pending_space && !out.empty()) out.push_back(' ');
        pending_space = false;
        out.push_back(ch);
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && is_space(s[i])) ++i;
    while (j > i && is_space(s[j - 1])) --j;
    return s.substr(i, j - i);
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> tokens;
    std::string cur;

    for (char c : s) {
        if (is_space(c)) {
            if (!cur.empty()) tokens.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) tokens.push_back(std::move(cur));
    return tokens;
}

}
