#include "vehicle/VehicleParser.hpp"
#include "vehicle/LineSegmenter.hpp"
#include "vehicle/MakeModel.hpp"
#include "vehicle/TextUtil.hpp"

namespace vehicle {

Vehicle VehicleParser::assemble(const std::string& year, const std::vector<std::string>& words) {
    Vehicle v;
    v.year = year;
    v.make = words[0];

    for (size_t i = 1; i < words.size(); ++i) {
        if (i > 1) v.model += " ";
        v.model += words[i];
    }

    v.full_text = year + " " + v.make;
    if (!v.model.empty()) v.full_text += " " + v.model;
    return v;
}

bool VehicleParser::parse_line(const std::string& line, Vehicle& out) const {
    auto ym = extract_year(line, cfg_.two_digit_century_cutoff);

    if (!ym) {
        // no year: keep the line so it can be fixed up by hand
        std::string cleaned = textutil::clean(line);
        if (cleaned.empty()) return false;
        out = Vehicle{};
        out.full_text = std::move(cleaned);
        return true;
    }

    const std::string text = textutil::clean(split_make_model(ym->rest_of_text));
    const std::vector<std::string> words = textutil::split_words(text);

    // a bare year is not a usable record
    if (words.empty()) return false;

    out = assemble(ym->year, words);
    return true;
}

std::vector<Vehicle> VehicleParser::parse(const std::string& raw_text) const {
    std::vector<Vehicle> vehicles;

    const std::string fixed = textutil::fix_ocr_errors(raw_text);
    const std::vector<std::string> lines = segment_lines(fixed);
    vehicles.reserve(lines.size());

    for (const auto& line : lines) {
        Vehicle v;
        if (parse_line(line, v)) vehicles.push_back(std::move(v));
    }
    return vehicles;
}

std::vector<Vehicle> parse_vehicles(const std::string& raw_text) {
    return VehicleParser().parse(raw_text);
}

} // namespace vehicle
