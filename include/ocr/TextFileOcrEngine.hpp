#pragma once

#include "ocr/OcrEngine.hpp"

namespace ocr {

// Replays OCR output captured earlier.
//   *.json -> {"text": "...", "confidence": 87.5}
//   other  -> whole file is the text, confidence 0
class TextFileOcrEngine final : public OcrEngine {
public:
    OcrResult recognize(const std::string& path) override;
};

OcrResult ocr_result_from_json_text(const std::string& json_text, const std::string& where);

} // namespace ocr
