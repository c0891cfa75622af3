#pragma once
#include <string>

namespace procutil {

bool command_exists(const std::string& command);

// Runs a shell command line and returns captured stdout.
// Throws std::runtime_error if the process cannot be started or exits non-zero.
std::string run_capture_stdout(const std::string& cmdline);

// single-quote for /bin/sh
std::string shell_quote(const std::string& arg);

} // namespace procutil
