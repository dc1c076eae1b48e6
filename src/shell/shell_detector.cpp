#include "shell/shell_detector.h"
#include "errors.h"
#include "fs/file_util.h"
#include "util/strings.h"
#include "loguru.hpp"

#include <cstdlib>
#include <filesystem>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

ShellEnvironment ShellEnvironment::fromProcess() {
    ShellEnvironment env;

    const char* shell = std::getenv("SHELL");
    const char* home = std::getenv("HOME");
    if (shell) env.shell = shell;
    if (home) env.home = home;

    if (env.shell.empty() || env.home.empty()) {
        struct passwd* pwd = getpwuid(getuid());
        if (pwd) {
            if (env.shell.empty() && pwd->pw_shell) env.shell = pwd->pw_shell;
            if (env.home.empty() && pwd->pw_dir) env.home = pwd->pw_dir;
        }
    }
    return env;
}

ShellKind parse_shell_kind(const std::string& nameOrPath) {
    std::string name = fs::path(trim(nameOrPath)).filename().string();
    // Login shells show up as "-zsh"
    if (starts_with(name, "-")) name = name.substr(1);

    if (name == "bash") return ShellKind::Bash;
    if (name == "zsh") return ShellKind::Zsh;
    if (name == "fish") return ShellKind::Fish;
    return ShellKind::Unsupported;
}

ShellKind detect_shell(const ShellEnvironment& env) {
    ShellKind kind = parse_shell_kind(env.shell);
    LOG_F(INFO, "Detected shell '%s' from '%s'", shell_kind_name(kind), env.shell.c_str());
    return kind;
}

const char* shell_kind_name(ShellKind kind) {
    switch (kind) {
        case ShellKind::Bash: return "bash";
        case ShellKind::Zsh: return "zsh";
        case ShellKind::Fish: return "fish";
        case ShellKind::Unsupported: break;
    }
    return "unsupported";
}

std::vector<std::string> supported_shells() {
    return {"bash", "zsh", "fish"};
}

std::vector<std::string> shell_config_candidates(ShellKind kind) {
    switch (kind) {
        case ShellKind::Bash: return {"~/.bashrc", "~/.bash_profile"};
        case ShellKind::Zsh: return {"~/.zshrc"};
        case ShellKind::Fish: return {"~/.config/fish/config.fish"};
        case ShellKind::Unsupported: break;
    }
    return {};
}

std::string shell_config_file(ShellKind kind, const ShellEnvironment& env) {
    std::vector<std::string> candidates = shell_config_candidates(kind);
    if (candidates.empty()) {
        std::string name = fs::path(env.shell).filename().string();
        throw UnsupportedShellError(name, supported_shells());
    }

    for (const auto& candidate : candidates) {
        std::string path = expand_home(candidate, env.home);
        if (file_exists(path)) {
            return path;
        }
    }
    return expand_home(candidates.front(), env.home);
}
