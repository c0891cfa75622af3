#pragma once

#include "ocr/OcrEngine.hpp"

#include <string>

namespace ocr {

struct TesseractOptions {
    std::string binary = "tesseract";
    std::string language = "eng";
    int page_seg_mode = 6; // uniform block of text
    std::string char_whitelist = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789 .-";
    bool preserve_interword_spaces = true;
};

// Shells out to the tesseract CLI in TSV mode.
class TesseractOcrEngine final : public OcrEngine {
    TesseractOptions opts_;

public:
    TesseractOcrEngine() = default;
    explicit TesseractOcrEngine(const TesseractOptions& opts) : opts_(opts) {}

    OcrResult recognize(const std::string& image_path) override;

    std::string command_line(const std::string& image_path) const;
};

// Rebuilds line text from word rows (level 5) and averages word confidence.
OcrResult parse_tesseract_tsv(const std::string& tsv);

} // namespace ocr
