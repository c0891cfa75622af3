#pragma once

#include "vehicle/Vehicle.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace io {

nlohmann::json vehicles_to_json(const std::vector<vehicle::Vehicle>& vehicles);

// Throws std::runtime_error naming the offending element on malformed input.
std::vector<vehicle::Vehicle> vehicles_from_json(const nlohmann::json& j);

void write_vehicles_json(const std::filesystem::path& path, const std::vector<vehicle::Vehicle>& vehicles);
std::vector<vehicle::Vehicle> read_vehicles_json(const std::filesystem::path& path);

std::string read_text_file(const std::filesystem::path& path);

} // namespace io
