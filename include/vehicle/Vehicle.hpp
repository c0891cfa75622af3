#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace vehicle {

struct Vehicle {
    std::string year;       // "" or 4 digits, 1900..2099
    std::string make;       // first token after the year
    std::string model;      // remaining tokens, single-spaced
    std::string full_text;  // display/edit surface, never empty
};

// joins full_text of each record with '\n'
std::string format_vehicle_list(const std::vector<Vehicle>& vehicles);

// Edits coming back from the list editor. Only full_text changes; year/make/model
// are left as parsed. Both throw std::out_of_range on a bad index.
void edit_full_text(std::vector<Vehicle>& vehicles, size_t index, const std::string& text);
void remove_at(std::vector<Vehicle>& vehicles, size_t index);

} // namespace vehicle
