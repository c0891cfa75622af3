#pragma once
#include <optional>
#include <string>

namespace vehicle {

// Two-digit years up to and including this value are read as 20xx, the rest as 19xx.
// Hand-tuned for yard stock (mostly post-2000); not tied to the calendar.
constexpr int kDefaultCenturyCutoff = 30;

struct YearMatch {
    std::string year;          // always 4 digits
    std::string rest_of_text;  // text after the year token, trimmed
};

// 1) word-bounded 19xx/20xx
// 2) two digits after a non-digit (or line start) and before a letter, optionally one space between
// First hit wins; nullopt when neither applies.
std::optional<YearMatch> extract_year(const std::string& line, int century_cutoff = kDefaultCenturyCutoff);

// "05" -> "2005", "99" -> "1999" (with the default cutoff)
std::string expand_two_digit_year(const std::string& two_digits, int century_cutoff = kDefaultCenturyCutoff);

} // namespace vehicle
