#include "vehicle/Vehicle.hpp"

#include <stdexcept>

namespace vehicle {

std::string format_vehicle_list(const std::vector<Vehicle>& vehicles) {
    std::string out;
    for (size_t i = 0; i < vehicles.size(); ++i) {
        if (i > 0) out += "\n";
        out += vehicles[i].full_text;
    }
    return out;
}

static void check_index(const std::vector<Vehicle>& vehicles, size_t index) {
    if (index >= vehicles.size()) {
        throw std::out_of_range("vehicle index " + std::to_string(index) +
                                " out of range (size=" + std::to_string(vehicles.size()) + ")");
    }
}

void edit_full_text(std::vector<Vehicle>& vehicles, size_t index, const std::string& text) {
    check_index(vehicles, index);
    vehicles[index].full_text = text;
}

void remove_at(std::vector<Vehicle>& vehicles, size_t index) {
    check_index(vehicles, index);
    vehicles.erase(vehicles.begin() + static_cast<std::ptrdiff_t>(index));
}

} // namespace vehicle
