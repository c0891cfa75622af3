#include "vehicle/YearExtractor.hpp"
#include "vehicle/TextUtil.hpp"

#include <regex>

namespace vehicle {

std::string expand_two_digit_year(const std::string& two_digits, int century_cutoff) {
    const int value = (two_digits[0] - '0') * 10 + (two_digits[1] - '0');
    return (value <= century_cutoff ? "20" : "19") + two_digits;
}

std::optional<YearMatch> extract_year(const std::string& line, int century_cutoff) {
    static const std::regex four_digit("\\b(19\\d{2}|20\\d{2})\\b");
    // lot number + year pattern, e.g. ". 05CHEVROLET" or "99 FORD"
    static const std::regex two_digit("(^|[^\\d])(\\d{2})(?=[A-Z]|\\s[A-Z])");

    std::smatch m;
    if (std::regex_search(line, m, four_digit)) {
        return YearMatch{m[1].str(), textutil::trim(m.suffix().str())};
    }

    if (std::regex_search(line, m, two_digit)) {
        return YearMatch{expand_two_digit_year(m[2].str(), century_cutoff),
                         textutil::trim(m.suffix().str())};
    }

    return std::nullopt;
}

} // namespace vehicle
