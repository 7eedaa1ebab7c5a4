#include "io/ProcUtil.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <sys/wait.h>

namespace procutil {

ProcResult run_capture(const std::string& cmdline) {
    ProcResult res;

    FILE* pipe = popen(cmdline.c_str(), "r");
    if (!pipe) return res;

    res.output.reserve(8192);
    char buf[4096];
    while (true) {
        const size_t n = std::fread(buf, 1, sizeof(buf), pipe);
        if (n > 0) res.output.append(buf, n);
        if (n < sizeof(buf)) break;
    }

    const int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    return res;
}

std::string run_capture_stdout(const std::string& cmdline) {
    ProcResult res = run_capture(cmdline);
    if (res.exit_code != 0) {
        throw std::runtime_error("command failed (exit " + std::to_string(res.exit_code) + "): " + cmdline);
    }
    return std::move(res.output);
}

bool command_exists(const std::string& name) {
    const std::string test = "command -v " + shell_quote(name) + " >/dev/null 2>&1";
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

} // namespace procutil
