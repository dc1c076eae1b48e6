#include "util/process.h"

#include <array>
#include <cstdio>
#include <sys/wait.h>

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string run_command_capture(const std::vector<std::string>& argv, int* exitCode) {
    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += shell_quote(arg);
    }
    cmd += " 2>/dev/null";

    std::array<char, 4096> buffer{};
    std::string result;

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        if (exitCode) *exitCode = -1;
        return {};
    }

    size_t bytesRead;
    while ((bytesRead = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.append(buffer.data(), bytesRead);
    }

    int rc = pclose(pipe);
    if (exitCode) {
        *exitCode = (rc != -1 && WIFEXITED(rc)) ? WEXITSTATUS(rc) : -1;
    }
    return result;
}
