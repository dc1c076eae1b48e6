#pragma once

#include <string>
#include <vector>

enum class ShellKind {
    Bash,
    Zsh,
    Fish,
    Unsupported
};

// Inputs to shell detection, passed explicitly so nothing is cached
struct ShellEnvironment {
    std::string shell;  // login shell path, e.g. /bin/zsh
    std::string home;

    // $SHELL and $HOME, falling back to the passwd entry
    static ShellEnvironment fromProcess();
};

ShellKind detect_shell(const ShellEnvironment& env);

// "bash"/"zsh"/"fish"/"unsupported"
const char* shell_kind_name(ShellKind kind);

// Bash/Zsh/Fish for a shell name or path; Unsupported otherwise
ShellKind parse_shell_kind(const std::string& nameOrPath);

std::vector<std::string> supported_shells();

// Startup files for a shell in preference order, "~/"-relative.
// Empty for Unsupported.
std::vector<std::string> shell_config_candidates(ShellKind kind);

// First existing candidate, or the first candidate if none exist (it will be
// created). Throws UnsupportedShellError for Unsupported.
std::string shell_config_file(ShellKind kind, const ShellEnvironment& env);
