#include "fs/file_lock.h"
#include "errors.h"
#include "loguru.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

std::string FileLock::lockPathFor(const std::string& targetPath) {
    fs::path p(targetPath);
    return (p.parent_path() / ("." + p.filename().string() + ".ssoprof.lock")).string();
}

FileLock::FileLock(const std::string& targetPath, std::chrono::milliseconds timeout)
    : m_lockPath(lockPathFor(targetPath))
{
    std::error_code ec;
    fs::path dir = fs::path(m_lockPath).parent_path();
    if (!dir.empty()) {
        fs::create_directories(dir, ec);
        if (ec) {
            throw WriteError("Cannot create directory " + dir.string() + ": " + ec.message(), targetPath);
        }
    }

    m_fd = ::open(m_lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (m_fd < 0) {
        throw WriteError("Cannot open lock file " + m_lockPath + ": " + strerror(errno), targetPath);
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool waited = false;
    while (true) {
        if (::flock(m_fd, LOCK_EX | LOCK_NB) == 0) {
            break;
        }
        int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (err != EWOULDBLOCK) {
            ::close(m_fd);
            m_fd = -1;
            throw WriteError("Cannot lock " + m_lockPath + ": " + strerror(err), targetPath);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::close(m_fd);
            m_fd = -1;
            LOG_F(WARNING, "Timed out waiting for lock on %s", targetPath.c_str());
            throw LockTimeoutError("Timed out after " + std::to_string(timeout.count()) +
                                   " ms waiting for another ssoprof process to finish with " + targetPath,
                                   targetPath);
        }
        if (!waited) {
            LOG_F(INFO, "Waiting for lock on %s", targetPath.c_str());
            waited = true;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    LOG_F(INFO, "Locked %s", targetPath.c_str());
}

FileLock::~FileLock() {
    if (m_fd >= 0) {
        ::flock(m_fd, LOCK_UN);
        ::close(m_fd);
    }
}
