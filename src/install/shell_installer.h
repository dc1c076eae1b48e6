#pragma once

#include "install/install_transaction.h"
#include "shell/marked_block.h"
#include "shell/script_generator.h"
#include "shell/shell_detector.h"

#include <string>

struct ShellInstallResult : InstallResult {
    ShellKind shell = ShellKind::Unsupported;
};

// Keeps the managed block in a shell startup file up to date
class ShellInstaller {
public:
    explicit ShellInstaller(TransactionOptions options = {}, MarkedBlockEditor editor = MarkedBlockEditor());

    // Insert or refresh the managed block in path with body
    InstallResult install(const std::string& path, const std::string& body) const;

    // Remove the managed block from path
    InstallResult uninstall(const std::string& path) const;

    bool isInstalled(const std::string& path) const;

    // Detect the shell from env, pick its startup file and install the
    // generator's body for it. Throws UnsupportedShellError.
    ShellInstallResult installDetected(const ShellEnvironment& env, const ScriptGenerator& generator) const;

    ShellInstallResult uninstallDetected(const ShellEnvironment& env) const;

    const MarkedBlockEditor& editor() const { return m_editor; }

private:
    TransactionOptions m_options;
    MarkedBlockEditor m_editor;
};
