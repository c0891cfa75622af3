#pragma once
#include <string>
#include <vector>

namespace vehicle {

// Lines shorter than this (after trimming) are never vehicle entries.
constexpr size_t kMinLineLength = 5;

// Header/location rows printed on yard sheets. Matched case-sensitively against
// normalized (upper-cased) text, so "Vehicle" never fires; kept as it has always been.
const std::vector<std::string>& noise_markers();

bool is_noise_line(const std::string& trimmed_line);

// split on runs of \n / \r, trim, drop short and noise lines; order preserved
std::vector<std::string> segment_lines(const std::string& text);

} // namespace vehicle
