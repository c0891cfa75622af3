#include "commands/edit.hpp"
#include "commands/parse.hpp"
#include "commands/search.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  yardscan parse --text <file> | --image <file> [args]\n"
        << "  yardscan edit --in <vehicles.json> [args]\n"
        << "  yardscan search --query \"<year make model>\" [args]\n"
        << "  yardscan help\n"
        << "\n"
        << "run `yardscan <command> --help` for options.\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    if (cmd == "parse")  return cmd_parse(argc - 1, argv + 1);
    if (cmd == "edit")   return cmd_edit(argc - 1, argv + 1);
    if (cmd == "search") return cmd_search(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage();
}
