#include "ocr/ProcUtil.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace procutil {

bool command_exists(const std::string& command) {
    std::string test = "command -v " + command + " >/dev/null 2>&1";
    return std::system(test.c_str()) == 0;
}

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out += "'";
    return out;
}

std::string run_capture_stdout(const std::string& cmdline) {
    FILE* pipe = popen(cmdline.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("failed to start: " + cmdline);
    }

    std::string out;
    out.reserve(8192);

    char buf[4096];
    while (true) {
        size_t n = std::fread(buf, 1, sizeof(buf), pipe);
        if (n > 0) out.append(buf, n);
        if (n < sizeof(buf)) break;
    }

    int rc = pclose(pipe);
    if (rc != 0) {
        throw std::runtime_error("command returned non-zero exit code (" + std::to_string(rc) + "): " + cmdline);
    }
    return out;
}

} // namespace procutil
