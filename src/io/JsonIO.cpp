#include "io/JsonIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace io {

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

// year/make/model may be absent in hand-written files
static std::string optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) return "";
    return require_string(j, key, where);
}

static json vehicle_to_json(const vehicle::Vehicle& v) {
    return json{
        {"year", v.year},
        {"make", v.make},
        {"model", v.model},
        {"fullText", v.full_text}
    };
}

static vehicle::Vehicle parse_vehicle(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }

    vehicle::Vehicle v;
    v.year      = optional_string(j, "year", where);
    v.make      = optional_string(j, "make", where);
    v.model     = optional_string(j, "model", where);
    v.full_text = require_string(j, "fullText", where);
    return v;
}

json vehicles_to_json(const std::vector<vehicle::Vehicle>& vehicles) {
    json arr = json::array();
    for (const auto& v : vehicles) arr.push_back(vehicle_to_json(v));
    return arr;
}

std::vector<vehicle::Vehicle> vehicles_from_json(const json& j) {
    // accept either a bare array or {"vehicles": [...]}
    const json* arr = &j;
    if (j.is_object() && j.contains("vehicles")) arr = &j.at("vehicles");

    if (!arr->is_array()) {
        throw std::runtime_error("vehicles must be an array");
    }

    std::vector<vehicle::Vehicle> out;
    out.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        std::ostringstream oss;
        oss << "vehicles[" << i << "]";
        out.push_back(parse_vehicle(arr->at(i), oss.str()));
    }
    return out;
}

void write_vehicles_json(const std::filesystem::path& path, const std::vector<vehicle::Vehicle>& vehicles) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());

    out << vehicles_to_json(vehicles).dump(2) << "\n";
}

std::vector<vehicle::Vehicle> read_vehicles_json(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open: " + path.string());

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("invalid JSON in " + path.string() + ": " + e.what());
    }
    return vehicles_from_json(j);
}

std::string read_text_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace io
