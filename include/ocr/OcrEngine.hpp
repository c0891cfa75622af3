#pragma once
#include <string>

namespace ocr {

struct OcrResult {
    std::string text;
    double confidence = 0.0; // 0..100, display only
};

class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    // Throws std::runtime_error when the image cannot be recognized.
    virtual OcrResult recognize(const std::string& image_path) = 0;
};

} // namespace ocr
