#include "vehicle/LineSegmenter.hpp"
#include "vehicle/TextUtil.hpp"

namespace vehicle {

const std::vector<std::string>& noise_markers() {
    static const std::vector<std::string> markers = {"YARD", "ROW", "LOCAT", "Vehicle"};
    return markers;
}

bool is_noise_line(const std::string& trimmed_line) {
    if (trimmed_line.size() < kMinLineLength) return true;
    for (const auto& marker : noise_markers()) {
        if (trimmed_line.find(marker) != std::string::npos) return true;
    }
    return false;
}

std::vector<std::string> segment_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string cur;

    auto flush = [&]() {
        std::string t = textutil::trim(cur);
        cur.clear();
        if (!t.empty() && !is_noise_line(t)) lines.push_back(std::move(t));
    };

    for (char ch : text) {
        if (ch == '\n' || ch == '\r') {
            flush();
        } else {
            cur.push_back(ch);
        }
    }
    flush();
    return lines;
}

} // namespace vehicle
