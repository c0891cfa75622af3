#include "vehicle/MakeModel.hpp"

#include <cctype>

namespace vehicle {

const std::vector<std::string>& known_makes() {
    static const std::vector<std::string> makes = {
        "CHEVROLET", "CHEVY", "FORD", "TOYOTA", "HONDA", "NISSAN", "GMC", "RAM",
        "JEEP", "DODGE", "HYUNDAI", "KIA", "MAZDA", "SUBARU", "VOLKSWAGEN", "VW",
        "BMW", "MERCEDES", "AUDI", "LEXUS", "ACURA", "INFINITI", "CADILLAC",
        "BUICK", "PONTIAC", "LINCOLN", "MERCURY", "CHRYSLER", "VOLVO", "MITSUBISHI"
    };
    return makes;
}

static std::string to_upper_ascii(const std::string& s) {
    std::string out = s;
    for (char& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c >= 'a' && c <= 'z') ch = static_cast<char>(c - 'a' + 'A');
    }
    return out;
}

std::string split_make_model(const std::string& text) {
    const std::string upper = to_upper_ascii(text);

    for (const auto& make : known_makes()) {
        if (upper.size() <= make.size()) continue;
        if (upper.compare(0, make.size(), make) != 0) continue;
        // already separated
        if (std::isspace(static_cast<unsigned char>(upper[make.size()]))) return text;

        return make + " " + text.substr(make.size());
    }
    return text;
}

} // namespace vehicle
