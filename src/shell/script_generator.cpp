#include "shell/script_generator.h"
#include "errors.h"

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

ScriptGenerator::ScriptGenerator(std::string binaryPath)
    : m_binary(std::move(binaryPath)) {}

std::string ScriptGenerator::currentExecutable() {
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (ec || self.empty()) {
        return "ssoprof";
    }
    return self.string();
}

std::string ScriptGenerator::quoteForShell(const std::string& text, ShellKind kind) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') {
            // POSIX shells can't escape inside single quotes; fish can
            out += kind == ShellKind::Fish ? "\\'" : "'\\''";
        } else if (c == '\\' && kind == ShellKind::Fish) {
            out += "\\\\";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string ScriptGenerator::posixBody() const {
    std::string bin = quoteForShell(m_binary, ShellKind::Bash);
    std::ostringstream ss;
    ss << "# Switch AWS profile: sp [profile]\n"
       << "sp() {\n"
       << "    local profile\n"
       << "    profile=\"$(" << bin << " select \"$@\")\"\n"
       << "    if [ $? -eq 0 ] && [ -n \"$profile\" ]; then\n"
       << "        export AWS_PROFILE=\"$profile\"\n"
       << "        echo \"Switched to AWS profile: $profile\" >&2\n"
       << "    else\n"
       << "        return 1\n"
       << "    fi\n"
       << "}\n";
    return ss.str();
}

std::string ScriptGenerator::fishBody() const {
    std::string bin = quoteForShell(m_binary, ShellKind::Fish);
    std::ostringstream ss;
    ss << "# Switch AWS profile: sp [profile]\n"
       << "function sp --description 'Switch AWS profile'\n"
       << "    set -l profile (" << bin << " select $argv)\n"
       << "    if test $status -eq 0; and test -n \"$profile\"\n"
       << "        set -gx AWS_PROFILE $profile\n"
       << "        echo \"Switched to AWS profile: $profile\" >&2\n"
       << "    else\n"
       << "        return 1\n"
       << "    end\n"
       << "end\n";
    return ss.str();
}

std::string ScriptGenerator::bodyFor(ShellKind kind) const {
    switch (kind) {
        case ShellKind::Bash:
        case ShellKind::Zsh:
            return posixBody();
        case ShellKind::Fish:
            return fishBody();
        case ShellKind::Unsupported:
            break;
    }
    throw UnsupportedShellError(shell_kind_name(kind), supported_shells());
}

std::string ScriptGenerator::installationInstructions(ShellKind kind, const std::string& configFile) const {
    std::string reload = kind == ShellKind::Fish ? ". " + configFile : "source " + configFile;
    std::ostringstream ss;
    ss << "Open a new terminal, or run:\n"
       << "    " << reload << "\n"
       << "Then use 'sp' to pick a profile interactively, or 'sp <profile>' to switch directly.\n";
    return ss.str();
}
