#include "fs/atomic_writer.h"
#include "fs/file_util.h"
#include "errors.h"
#include "util/strings.h"
#include "loguru.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

static const int DEFAULT_MODE = 0644;

namespace {

// Unlinks the temp file unless the rename consumed it
struct TempFileGuard {
    std::string path;
    int fd = -1;
    bool committed = false;

    ~TempFileGuard() {
        if (fd >= 0) {
            ::close(fd);
        }
        if (!committed && !path.empty() && ::unlink(path.c_str()) != 0 && errno != ENOENT) {
            LOG_F(WARNING, "Failed to remove temp file %s: %s", path.c_str(), strerror(errno));
        }
    }
};

}  // namespace

// Dotfile managers often symlink startup files; write through to the real file
static std::string resolve_target(const std::string& path) {
    std::error_code ec;
    if (fs::is_symlink(fs::symlink_status(path, ec))) {
        fs::path real = fs::canonical(path, ec);
        if (!ec) {
            LOG_F(INFO, "%s is a symlink, writing to %s", path.c_str(), real.c_str());
            return real.string();
        }
    }
    return path;
}

static void write_all(int fd, const std::string& content, const std::string& path) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw WriteError("Failed to write " + path + ": " + strerror(errno), path);
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
}

static void sync_directory(const fs::path& dir) {
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) {
        return;
    }
    if (::fsync(dfd) != 0) {
        LOG_F(WARNING, "fsync of directory %s failed: %s", dir.c_str(), strerror(errno));
    }
    ::close(dfd);
}

AtomicWriter::AtomicWriter(CommitHook beforeCommit)
    : m_beforeCommit(std::move(beforeCommit)) {}

std::string AtomicWriter::tempPrefix(const std::string& path) {
    return "." + fs::path(path).filename().string() + ".ssoprof-tmp-";
}

size_t AtomicWriter::cleanupStaleTemps(const std::string& path) {
    fs::path dir = fs::path(path).parent_path();
    if (dir.empty()) dir = ".";
    std::string prefix = tempPrefix(path);

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return 0;
    }

    size_t removed = 0;
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (!starts_with(name, prefix)) continue;
        std::error_code rmEc;
        if (fs::remove(entry.path(), rmEc)) {
            LOG_F(INFO, "Removed stale temp file %s", entry.path().c_str());
            ++removed;
        } else if (rmEc) {
            LOG_F(WARNING, "Failed to remove stale temp file %s: %s",
                  entry.path().c_str(), rmEc.message().c_str());
        }
    }
    return removed;
}

void AtomicWriter::write(const std::string& path, const std::string& content, int mode, bool* committed) const {
    if (committed) *committed = false;
    std::string target = resolve_target(path);
    fs::path dir = fs::path(target).parent_path();
    if (dir.empty()) dir = ".";

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw WriteError("Cannot create directory " + dir.string() + ": " + ec.message(), path);
    }

    cleanupStaleTemps(target);

    if (mode < 0) {
        mode = file_mode(target);
        if (mode < 0) mode = DEFAULT_MODE;
    }

    std::string pattern = (dir / tempPrefix(target)).string() + "XXXXXX";
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    TempFileGuard temp;
    temp.fd = mkstemp(buf.data());
    if (temp.fd < 0) {
        throw WriteError("Cannot create temp file in " + dir.string() + ": " + strerror(errno), path);
    }
    temp.path = buf.data();

    write_all(temp.fd, content, path);

    if (::fchmod(temp.fd, static_cast<mode_t>(mode)) != 0) {
        throw WriteError("Failed to set permissions on " + temp.path + ": " + strerror(errno), path);
    }
    if (::fsync(temp.fd) != 0) {
        throw WriteError("Failed to flush " + path + ": " + strerror(errno), path);
    }
    int fd = temp.fd;
    temp.fd = -1;
    if (::close(fd) != 0) {
        throw WriteError("Failed to close temp file for " + path + ": " + strerror(errno), path);
    }

    if (m_beforeCommit) {
        m_beforeCommit(temp.path);
    }

    if (::rename(temp.path.c_str(), target.c_str()) != 0) {
        throw WriteError("Failed to replace " + path + ": " + strerror(errno), path);
    }
    temp.committed = true;
    if (committed) *committed = true;
    sync_directory(dir);

    LOG_F(INFO, "Wrote %zu bytes to %s", content.size(), target.c_str());
}
