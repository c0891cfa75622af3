#include "commands/parse.hpp"

#include "io/JsonIO.hpp"
#include "ocr/TesseractOcrEngine.hpp"
#include "ocr/TextFileOcrEngine.hpp"
#include "vehicle/VehicleParser.hpp"

#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (argv[i] == key) return true;
    }
    return false;
}

static int parse_usage() {
    std::cerr
        << "usage:\n"
        << "  yardscan parse --text <file> [options]\n"
        << "  yardscan parse --image <file> [options]\n"
        << "\n"
        << "options:\n"
        << "  --ocr <tesseract|file>       engine for --image, default: tesseract\n"
        << "  --century_cutoff <n>         two-digit years <= n read as 20xx, default: 30\n"
        << "  --out <path>                 write vehicles as JSON\n"
        << "  --raw                        also print the OCR text\n";
    return 2;
}

int cmd_parse(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) {
        parse_usage();
        return 0;
    }

    const std::string text_path  = get_arg(argc, argv, "--text", "");
    const std::string image_path = get_arg(argc, argv, "--image", "");
    const std::string engine     = get_arg(argc, argv, "--ocr", "tesseract");
    const std::string out_path   = get_arg(argc, argv, "--out", "");
    const std::string cutoff_s   = get_arg(argc, argv, "--century_cutoff", "");

    if (text_path.empty() == image_path.empty()) {
        std::cerr << "error: exactly one of --text or --image is required\n";
        return parse_usage();
    }

    vehicle::ParserConfig cfg;
    if (!cutoff_s.empty()) {
        try {
            size_t used = 0;
            cfg.two_digit_century_cutoff = std::stoi(cutoff_s, &used);
            if (used != cutoff_s.size()) throw std::invalid_argument(cutoff_s);
        } catch (const std::exception&) {
            std::cerr << "error: --century_cutoff must be an integer, got: " << cutoff_s << "\n";
            return 2;
        }
        if (cfg.two_digit_century_cutoff < 0 || cfg.two_digit_century_cutoff > 99) {
            std::cerr << "error: --century_cutoff must be in 0..99\n";
            return 2;
        }
    }

    std::unique_ptr<ocr::OcrEngine> ocr_engine;
    std::string source = text_path;
    if (!text_path.empty() || engine == "file") {
        ocr_engine = std::make_unique<ocr::TextFileOcrEngine>();
        if (source.empty()) source = image_path;
    } else if (engine == "tesseract") {
        ocr_engine = std::make_unique<ocr::TesseractOcrEngine>();
        source = image_path;
    } else {
        std::cerr << "error: unknown --ocr engine: " << engine << "\n";
        return parse_usage();
    }

    try {
        const ocr::OcrResult ocr_result = ocr_engine->recognize(source);
        if (ocr_result.text.empty()) {
            std::cerr << "error: no text recognized in " << source << "\n";
            return 1;
        }

        if (has_flag(argc, argv, "--raw")) {
            std::cout << "--- raw OCR text ---\n" << ocr_result.text << "\n--------------------\n";
        }

        char conf[32];
        std::snprintf(conf, sizeof(conf), "%.1f", ocr_result.confidence);
        std::cout << "OCR_CONFIDENCE: " << conf << "%\n";

        const vehicle::VehicleParser parser(cfg);
        const std::vector<vehicle::Vehicle> vehicles = parser.parse(ocr_result.text);

        std::cout << "VEHICLES: " << vehicles.size() << "\n";
        if (vehicles.empty()) {
            std::cerr << "warning: could not detect any vehicles; try a clearer image\n";
        }
        for (size_t i = 0; i < vehicles.size(); ++i) {
            std::cout << (i + 1) << ". " << vehicles[i].full_text << "\n";
        }

        if (!out_path.empty()) {
            io::write_vehicles_json(out_path, vehicles);
            std::cout << "OUT_JSON: " << out_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
