#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// What happened to the target file when an install transaction failed
enum class RollbackState {
    NotNeeded,   // failed before anything was written
    RolledBack,  // written, then restored to the previous content
    Failed       // written, and the restore failed too
};

// Base class for every failure ssoprof reports to the user.
// Carries the file the failure is about and whether the transaction that
// raised it put the file back into its previous state.
class SsoprofError : public std::runtime_error {
public:
    SsoprofError(const std::string& message, std::string path)
        : std::runtime_error(message), m_path(std::move(path)) {}

    const std::string& path() const { return m_path; }

    RollbackState rollbackState() const { return m_rollback; }
    bool rolledBack() const { return m_rollback == RollbackState::RolledBack; }
    void setRollbackState(RollbackState state) { m_rollback = state; }

private:
    std::string m_path;
    RollbackState m_rollback = RollbackState::NotNeeded;
};

// Text that cannot be turned into a document (orphan key before any header,
// unbalanced managed-block sentinels).
class MalformedDocument : public SsoprofError {
public:
    MalformedDocument(const std::string& path, size_t lineNumber, const std::string& line,
                      const std::string& reason)
        : SsoprofError((path.empty() ? std::string("line ") : path + ":") + std::to_string(lineNumber) +
                           ": " + reason + ": " + line,
                       path)
        , m_lineNumber(lineNumber)
        , m_line(line) {}

    size_t lineNumber() const { return m_lineNumber; }
    const std::string& line() const { return m_line; }

private:
    size_t m_lineNumber;
    std::string m_line;
};

class UnsupportedShellError : public SsoprofError {
public:
    UnsupportedShellError(const std::string& shell, const std::vector<std::string>& supported)
        : SsoprofError(buildMessage(shell, supported), "")
        , m_shell(shell)
        , m_supported(supported) {}

    const std::string& shell() const { return m_shell; }
    const std::vector<std::string>& supportedShells() const { return m_supported; }

private:
    static std::string buildMessage(const std::string& shell, const std::vector<std::string>& supported) {
        std::string msg = "Unsupported shell '" + (shell.empty() ? std::string("unknown") : shell) +
                          "' (supported:";
        for (const auto& s : supported) {
            msg += " " + s;
        }
        msg += "). Add the profile switcher to your shell startup file manually.";
        return msg;
    }

    std::string m_shell;
    std::vector<std::string> m_supported;
};

class BackupError : public SsoprofError {
public:
    using SsoprofError::SsoprofError;
};

class WriteError : public SsoprofError {
public:
    using SsoprofError::SsoprofError;
};

// Another process holds the lock on the same target; retry later.
class LockTimeoutError : public SsoprofError {
public:
    using SsoprofError::SsoprofError;
};

// Settings file or session definition that cannot be used.
class SettingsError : public SsoprofError {
public:
    using SsoprofError::SsoprofError;
};
