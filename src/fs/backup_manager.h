#pragma once

#include <string>
#include <vector>
#include <cstddef>

// A snapshot of a file taken right before it was rewritten.
// A null backup (empty backup_path) means there was no file to protect.
struct Backup {
    std::string original_path;
    std::string backup_path;
    std::string timestamp;  // YYYYMMDDTHHMMSS.ffffff, UTC; sorts chronologically

    bool isNull() const { return backup_path.empty(); }
};

// Timestamped sibling copies: <path>.ssoprof-backup_<timestamp>
class BackupManager {
public:
    static constexpr size_t DEFAULT_KEEP = 5;

    explicit BackupManager(std::string suffix = ".ssoprof-backup");

    // Copy path's bytes to a new backup. Null backup if path doesn't exist.
    // Throws BackupError if the file exists but can't be copied.
    Backup snapshot(const std::string& path) const;

    // Put the backup's bytes back over the original path.
    // Throws BackupError if the backup file is gone or the copy fails.
    void restore(const Backup& backup) const;

    // Backups of path, newest first
    std::vector<Backup> list(const std::string& path) const;

    // Delete all but the newest `keep` backups of path, never `protect`.
    // Returns how many were deleted.
    size_t prune(const std::string& path, size_t keep = DEFAULT_KEEP,
                 const std::string& protect = "") const;

    const std::string& suffix() const { return m_suffix; }

private:
    std::string m_suffix;
};
