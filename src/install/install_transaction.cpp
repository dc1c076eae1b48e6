#include "install/install_transaction.h"
#include "errors.h"
#include "fs/file_lock.h"
#include "fs/file_util.h"
#include "loguru.hpp"

#include <filesystem>

namespace fs = std::filesystem;

// Put the file back the way it was before this transaction wrote to it
static RollbackState roll_back(const BackupManager& backups, const Backup& backup, const std::string& path) {
    if (!backup.isNull()) {
        try {
            backups.restore(backup);
            return RollbackState::RolledBack;
        } catch (const BackupError& e) {
            LOG_F(ERROR, "Rollback of %s failed: %s", path.c_str(), e.what());
            return RollbackState::Failed;
        }
    }

    // There was no file before; make sure we don't leave one behind
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOG_F(ERROR, "Rollback of %s failed: %s", path.c_str(), ec.message().c_str());
        return RollbackState::Failed;
    }
    return RollbackState::RolledBack;
}

InstallResult run_install_transaction(const std::string& path,
                                      const ContentTransform& transform,
                                      const TransactionOptions& options) {
    InstallResult result;
    result.path = path;

    FileLock lock(path, options.lock_timeout);

    std::string current;
    if (file_exists(path)) {
        std::string err;
        if (!read_file(path, current, &err)) {
            throw WriteError("Cannot read " + path + ": " + err, path);
        }
    }

    std::string updated = transform(current);
    if (updated == current) {
        LOG_F(INFO, "%s is already up to date", path.c_str());
        return result;
    }

    BackupManager backups(options.backup_suffix);
    result.backup = backups.snapshot(path);

    AtomicWriter writer(options.before_commit);
    bool committed = false;
    try {
        writer.write(path, updated, options.mode, &committed);

        std::string written;
        std::string err;
        if (!read_file(path, written, &err) || written != updated) {
            throw WriteError("Verification of " + path + " failed after writing" +
                             (err.empty() ? std::string() : ": " + err), path);
        }
    } catch (SsoprofError& e) {
        // Before the rename the target still holds its old bytes
        e.setRollbackState(committed ? roll_back(backups, result.backup, path) : RollbackState::NotNeeded);
        LOG_F(ERROR, "Update of %s failed (%s): %s", path.c_str(),
              committed ? (e.rolledBack() ? "rolled back" : "rollback failed") : "target untouched", e.what());
        throw;
    } catch (const std::exception& e) {
        WriteError wrapped("Update of " + path + " interrupted: " + e.what(), path);
        wrapped.setRollbackState(committed ? roll_back(backups, result.backup, path) : RollbackState::NotNeeded);
        LOG_F(ERROR, "%s", wrapped.what());
        throw wrapped;
    }

    result.changed = true;
    backups.prune(path, options.keep_backups, result.backup.backup_path);
    return result;
}
