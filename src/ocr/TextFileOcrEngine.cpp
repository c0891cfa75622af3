#include "ocr/TextFileOcrEngine.hpp"
#include "io/JsonIO.hpp"

#include "nlohmann/json.hpp"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ocr {

OcrResult ocr_result_from_json_text(const std::string& json_text, const std::string& where) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("invalid JSON in " + where + ": " + e.what());
    }

    if (!j.is_object()) throw std::runtime_error(where + " must be an object");
    if (!j.contains("text") || !j["text"].is_string()) {
        throw std::runtime_error(where + ".text must be a string");
    }

    OcrResult r;
    r.text = j["text"].get<std::string>();
    if (j.contains("confidence")) {
        if (!j["confidence"].is_number()) throw std::runtime_error(where + ".confidence must be a number");
        r.confidence = j["confidence"].get<double>();
    }
    return r;
}

OcrResult TextFileOcrEngine::recognize(const std::string& path) {
    const fs::path p(path);
    const std::string content = io::read_text_file(p);

    if (p.extension() == ".json") return ocr_result_from_json_text(content, p.string());

    OcrResult r;
    r.text = content;
    return r;
}

} // namespace ocr
