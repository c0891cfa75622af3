#pragma once
#include "vehicle/Vehicle.hpp"
#include "vehicle/YearExtractor.hpp"

#include <string>
#include <vector>

namespace vehicle {

struct ParserConfig {
    int two_digit_century_cutoff = kDefaultCenturyCutoff;
};

// Turns raw OCR text from a yard inventory sheet into YEAR MAKE MODEL records.
// Never throws on content: lines without a year become fullText-only records,
// lines that clean down to nothing are dropped.
class VehicleParser {
public:
    VehicleParser() = default;
    explicit VehicleParser(const ParserConfig& cfg) : cfg_(cfg) {}

    std::vector<Vehicle> parse(const std::string& raw_text) const;

    // one already-segmented line; returns false when the line yields no record
    bool parse_line(const std::string& line, Vehicle& out) const;

private:
    ParserConfig cfg_{};

    static Vehicle assemble(const std::string& year, const std::vector<std::string>& words);
};

// default-config convenience
std::vector<Vehicle> parse_vehicles(const std::string& raw_text);

} // namespace vehicle
