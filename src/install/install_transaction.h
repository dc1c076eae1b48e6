#pragma once

#include "fs/atomic_writer.h"
#include "fs/backup_manager.h"

#include <chrono>
#include <functional>
#include <string>

struct TransactionOptions {
    std::chrono::milliseconds lock_timeout{10000};
    size_t keep_backups = BackupManager::DEFAULT_KEEP;
    std::string backup_suffix = ".ssoprof-backup";
    int mode = -1;  // permissions for the written file; < 0 keeps the existing ones

    // Test seam: runs between temp-file write and rename
    AtomicWriter::CommitHook before_commit;
};

struct InstallResult {
    std::string path;
    bool changed = false;
    Backup backup;  // null when nothing was written or the file was new
};

// Turns the current file content ("" if absent) into the desired content.
// Must be pure; it may throw to abort before anything is written.
using ContentTransform = std::function<std::string(const std::string& current)>;

// Lock, read, transform, and if the content changed: back up, replace
// atomically and verify. A failure after the rename restores the previous
// content; every failure is re-thrown with the rollback state recorded on
// the error (NotNeeded when the target was never replaced).
InstallResult run_install_transaction(const std::string& path,
                                      const ContentTransform& transform,
                                      const TransactionOptions& options);
