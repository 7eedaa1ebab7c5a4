#pragma once
#include <string>

namespace procutil {

struct ProcResult {
    int exit_code = -1;    // -1 when the command could not be started
    std::string output;    // captured stdout
};

// Runs a shell command line and captures its stdout.
ProcResult run_capture(const std::string& cmdline);

// stdout of a command that must exit 0; throws std::runtime_error otherwise
std::string run_capture_stdout(const std::string& cmdline);

// true when `name` resolves on PATH
bool command_exists(const std::string& name);

// single-quoted for /bin/sh
std::string shell_quote(const std::string& arg);

} // namespace procutil
