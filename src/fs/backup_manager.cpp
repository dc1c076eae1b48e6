#include "fs/backup_manager.h"
#include "fs/atomic_writer.h"
#include "fs/file_util.h"
#include "errors.h"
#include "util/strings.h"
#include "loguru.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

static std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    time_t t = std::chrono::system_clock::to_time_t(secs);

    struct tm tm;
    gmtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y%m%dT%H%M%S") << '.' << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

BackupManager::BackupManager(std::string suffix)
    : m_suffix(std::move(suffix)) {}

Backup BackupManager::snapshot(const std::string& path) const {
    Backup backup;
    backup.original_path = path;

    if (!file_exists(path)) {
        LOG_F(INFO, "No backup needed, %s does not exist yet", path.c_str());
        return backup;
    }

    std::string content;
    std::string err;
    if (!read_file(path, content, &err)) {
        throw BackupError("Cannot read " + path + " to back it up: " + err, path);
    }

    // Two snapshots within one microsecond get distinct names
    auto now = std::chrono::system_clock::now();
    do {
        backup.timestamp = format_timestamp(now);
        backup.backup_path = path + m_suffix + "_" + backup.timestamp;
        now += std::chrono::microseconds(1);
    } while (file_exists(backup.backup_path));

    try {
        AtomicWriter().write(backup.backup_path, content, file_mode(path));
    } catch (const WriteError& e) {
        throw BackupError(std::string("Cannot create backup of ") + path + ": " + e.what(), path);
    }

    LOG_F(INFO, "Backed up %s to %s", path.c_str(), backup.backup_path.c_str());
    return backup;
}

void BackupManager::restore(const Backup& backup) const {
    if (backup.isNull()) {
        throw BackupError("No backup to restore for " + backup.original_path, backup.original_path);
    }
    if (!file_exists(backup.backup_path)) {
        throw BackupError("Backup " + backup.backup_path + " no longer exists", backup.original_path);
    }

    std::string content;
    std::string err;
    if (!read_file(backup.backup_path, content, &err)) {
        throw BackupError("Cannot read backup " + backup.backup_path + ": " + err, backup.original_path);
    }

    try {
        AtomicWriter().write(backup.original_path, content, file_mode(backup.backup_path));
    } catch (const WriteError& e) {
        throw BackupError(std::string("Cannot restore ") + backup.original_path + ": " + e.what(),
                          backup.original_path);
    }

    LOG_F(INFO, "Restored %s from %s", backup.original_path.c_str(), backup.backup_path.c_str());
}

std::vector<Backup> BackupManager::list(const std::string& path) const {
    std::vector<Backup> backups;

    fs::path dir = fs::path(path).parent_path();
    if (dir.empty()) dir = ".";
    std::string prefix = fs::path(path).filename().string() + m_suffix + "_";

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return backups;
    }

    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (!starts_with(name, prefix)) continue;

        Backup backup;
        backup.original_path = path;
        backup.backup_path = (dir / name).string();
        backup.timestamp = name.substr(prefix.size());
        backups.push_back(std::move(backup));
    }

    std::sort(backups.begin(), backups.end(), [](const Backup& a, const Backup& b) {
        return a.timestamp > b.timestamp;
    });
    return backups;
}

size_t BackupManager::prune(const std::string& path, size_t keep, const std::string& protect) const {
    std::vector<Backup> backups = list(path);
    size_t removed = 0;

    for (size_t i = keep; i < backups.size(); ++i) {
        const Backup& old = backups[i];
        if (!protect.empty() && old.backup_path == protect) {
            continue;
        }
        std::error_code ec;
        if (fs::remove(old.backup_path, ec)) {
            ++removed;
        } else if (ec) {
            LOG_F(WARNING, "Failed to delete old backup %s: %s", old.backup_path.c_str(), ec.message().c_str());
        }
    }

    if (removed > 0) {
        LOG_F(INFO, "Pruned %zu old backup(s) of %s", removed, path.c_str());
    }
    return removed;
}
