#include "commands/edit.hpp"

#include "io/JsonIO.hpp"
#include "vehicle/Vehicle.hpp"

#include <algorithm>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

static std::vector<std::string> get_all_args(int argc, char** argv, const std::string& key) {
    std::vector<std::string> out;
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) out.push_back(argv[++i]);
    }
    return out;
}

static int edit_usage() {
    std::cerr
        << "usage:\n"
        << "  yardscan edit --in <vehicles.json> [--set <n>=<text>]... [--delete <n>]... [--out <path>]\n"
        << "\n"
        << "  <n> is the 1-based position printed by `yardscan parse`.\n"
        << "  edits are applied before deletions; --out defaults to --in.\n";
    return 2;
}

// 1-based position -> 0-based index, 0 on failure
static size_t parse_position(const std::string& s) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return c >= '0' && c <= '9'; })) return 0;
    try {
        return static_cast<size_t>(std::stoul(s));
    } catch (const std::exception&) {
        return 0;
    }
}

int cmd_edit(int argc, char** argv) {
    const std::string in_path = get_arg(argc, argv, "--in", "");
    if (in_path.empty()) {
        std::cerr << "error: missing --in\n";
        return edit_usage();
    }
    const std::string out_path = get_arg(argc, argv, "--out", in_path);

    struct Edit {
        size_t pos;
        std::string text;
    };
    std::vector<Edit> edits;
    for (const auto& s : get_all_args(argc, argv, "--set")) {
        const size_t eq = s.find('=');
        const size_t pos = eq == std::string::npos ? 0 : parse_position(s.substr(0, eq));
        if (pos == 0) {
            std::cerr << "error: --set expects <n>=<text>, got: " << s << "\n";
            return 2;
        }
        edits.push_back(Edit{pos, s.substr(eq + 1)});
    }

    std::vector<size_t> deletions;
    for (const auto& s : get_all_args(argc, argv, "--delete")) {
        const size_t pos = parse_position(s);
        if (pos == 0) {
            std::cerr << "error: --delete expects a position, got: " << s << "\n";
            return 2;
        }
        deletions.push_back(pos);
    }
    std::sort(deletions.begin(), deletions.end(), std::greater<size_t>());
    deletions.erase(std::unique(deletions.begin(), deletions.end()), deletions.end());

    try {
        std::vector<vehicle::Vehicle> vehicles = io::read_vehicles_json(in_path);

        for (const auto& e : edits) vehicle::edit_full_text(vehicles, e.pos - 1, e.text);
        for (size_t pos : deletions) vehicle::remove_at(vehicles, pos - 1);

        io::write_vehicles_json(out_path, vehicles);

        std::cout << "VEHICLES: " << vehicles.size() << "\n";
        std::cout << vehicle::format_vehicle_list(vehicles) << "\n";
        std::cout << "OUT_JSON: " << out_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
