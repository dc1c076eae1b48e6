#pragma once

#include "shell/shell_detector.h"
#include <string>

// Produces the body of the managed block: an `sp` function that asks
// `ssoprof select` for a profile name and exports it as AWS_PROFILE.
class ScriptGenerator {
public:
    explicit ScriptGenerator(std::string binaryPath);

    // Path of the running executable, "ssoprof" if it can't be resolved
    static std::string currentExecutable();

    // Throws UnsupportedShellError for Unsupported
    std::string bodyFor(ShellKind kind) const;

    std::string posixBody() const;  // bash and zsh
    std::string fishBody() const;

    // How to start using the function after installing into configFile
    std::string installationInstructions(ShellKind kind, const std::string& configFile) const;

    // Single-quoted literal for the given shell
    static std::string quoteForShell(const std::string& text, ShellKind kind);

    const std::string& binaryPath() const { return m_binary; }

private:
    std::string m_binary;
};
