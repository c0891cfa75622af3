#include "ocr/TesseractOcrEngine.hpp"
#include "ocr/ProcUtil.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace ocr {

static std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::string cur;
    for (char c : line) {
        if (c == '\t') {
            fields.push_back(cur);
            cur.clear();
        } else if (c != '\r') {
            cur.push_back(c);
        }
    }
    fields.push_back(cur);
    return fields;
}

OcrResult parse_tesseract_tsv(const std::string& tsv) {
    // columns: level page block par line word left top width height conf text
    enum { kLevel = 0, kPage, kBlock, kPar, kLine, kWord, kLeft, kTop, kWidth, kHeight, kConf, kText };
    const int kWordLevel = 5;

    OcrResult r;
    double conf_sum = 0.0;
    size_t conf_n = 0;

    bool have_key = false;
    std::tuple<int, int, int, int> last_key;
    std::string cur_line;

    size_t pos = 0;
    while (pos < tsv.size()) {
        size_t nl = tsv.find('\n', pos);
        if (nl == std::string::npos) nl = tsv.size();
        const std::string row = tsv.substr(pos, nl - pos);
        pos = nl + 1;

        auto f = split_tabs(row);
        if (f.size() <= static_cast<size_t>(kText)) continue;

        char* end = nullptr;
        const long level = std::strtol(f[kLevel].c_str(), &end, 10);
        if (end == f[kLevel].c_str() || level != kWordLevel) continue; // header or non-word row

        const std::string& word = f[kText];
        if (word.empty()) continue;

        auto key = std::make_tuple(std::atoi(f[kPage].c_str()), std::atoi(f[kBlock].c_str()),
                                   std::atoi(f[kPar].c_str()), std::atoi(f[kLine].c_str()));
        if (have_key && key != last_key) {
            r.text += cur_line;
            r.text += "\n";
            cur_line.clear();
        }
        have_key = true;
        last_key = key;

        if (!cur_line.empty()) cur_line += " ";
        cur_line += word;

        const double conf = std::strtod(f[kConf].c_str(), nullptr);
        if (conf >= 0.0) {
            conf_sum += conf;
            ++conf_n;
        }
    }

    if (!cur_line.empty()) {
        r.text += cur_line;
        r.text += "\n";
    }
    if (conf_n > 0) r.confidence = conf_sum / static_cast<double>(conf_n);
    return r;
}

std::string TesseractOcrEngine::command_line(const std::string& image_path) const {
    std::string cmd = procutil::shell_quote(opts_.binary);
    cmd += " " + procutil::shell_quote(image_path) + " stdout";
    cmd += " -l " + procutil::shell_quote(opts_.language);
    cmd += " --psm " + std::to_string(opts_.page_seg_mode);
    if (!opts_.char_whitelist.empty()) {
        cmd += " -c " + procutil::shell_quote("tessedit_char_whitelist=" + opts_.char_whitelist);
    }
    if (opts_.preserve_interword_spaces) cmd += " -c preserve_interword_spaces=1";
    cmd += " tsv 2>/dev/null";
    return cmd;
}

OcrResult TesseractOcrEngine::recognize(const std::string& image_path) {
    if (!procutil::command_exists(opts_.binary)) {
        throw std::runtime_error(opts_.binary + " not found. Please install tesseract-ocr (e.g., apt-get install -y tesseract-ocr).");
    }
    if (!std::filesystem::exists(image_path)) {
        throw std::runtime_error("image not found: " + image_path);
    }
    return parse_tesseract_tsv(procutil::run_capture_stdout(command_line(image_path)));
}

} // namespace ocr
