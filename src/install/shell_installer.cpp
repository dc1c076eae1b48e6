#include "install/shell_installer.h"
#include "errors.h"
#include "fs/file_util.h"
#include "loguru.hpp"

ShellInstaller::ShellInstaller(TransactionOptions options, MarkedBlockEditor editor)
    : m_options(std::move(options)), m_editor(std::move(editor)) {}

InstallResult ShellInstaller::install(const std::string& path, const std::string& body) const {
    return run_install_transaction(path, [&](const std::string& current) {
        try {
            return m_editor.upsert(current, body);
        } catch (const MalformedDocument& e) {
            // Attach the file name to the marker error
            throw MalformedDocument(path, e.lineNumber(), e.line(), "unbalanced ssoprof markers");
        }
    }, m_options);
}

InstallResult ShellInstaller::uninstall(const std::string& path) const {
    if (!file_exists(path)) {
        InstallResult result;
        result.path = path;
        return result;
    }
    return run_install_transaction(path, [&](const std::string& current) {
        try {
            return m_editor.remove(current);
        } catch (const MalformedDocument& e) {
            throw MalformedDocument(path, e.lineNumber(), e.line(), "unbalanced ssoprof markers");
        }
    }, m_options);
}

bool ShellInstaller::isInstalled(const std::string& path) const {
    std::string content;
    if (!file_exists(path) || !read_file(path, content)) {
        return false;
    }
    return m_editor.contains(content);
}

ShellInstallResult ShellInstaller::installDetected(const ShellEnvironment& env,
                                                   const ScriptGenerator& generator) const {
    ShellInstallResult result;
    result.shell = detect_shell(env);
    std::string path = shell_config_file(result.shell, env);

    InstallResult base = install(path, generator.bodyFor(result.shell));
    result.path = base.path;
    result.changed = base.changed;
    result.backup = base.backup;
    LOG_F(INFO, "Shell integration for %s in %s %s", shell_kind_name(result.shell), path.c_str(),
          result.changed ? "installed" : "already up to date");
    return result;
}

ShellInstallResult ShellInstaller::uninstallDetected(const ShellEnvironment& env) const {
    ShellInstallResult result;
    result.shell = detect_shell(env);
    std::string path = shell_config_file(result.shell, env);

    InstallResult base = uninstall(path);
    result.path = base.path;
    result.changed = base.changed;
    result.backup = base.backup;
    return result;
}
