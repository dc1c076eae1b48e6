#pragma once

#include <chrono>
#include <string>

// Exclusive advisory lock on a target file, held for the lifetime of the
// object. Uses flock(2) on a sibling ".<name>.ssoprof.lock" file so the
// target itself can be replaced by rename while locked.
class FileLock {
public:
    // Waits up to `timeout`, then throws LockTimeoutError
    FileLock(const std::string& targetPath, std::chrono::milliseconds timeout);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::string& lockPath() const { return m_lockPath; }

    static std::string lockPathFor(const std::string& targetPath);

private:
    int m_fd = -1;
    std::string m_lockPath;

    static constexpr std::chrono::milliseconds POLL_INTERVAL{25};
};
