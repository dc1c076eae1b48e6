#pragma once

#include <functional>
#include <string>

// Replaces a file's content all-or-nothing: the new bytes go to a temp file
// in the same directory which is then renamed over the target. Readers see
// either the old or the new file, never a mix.
class AtomicWriter {
public:
    // Called with the temp file path after the content is on disk and
    // before the rename. Throwing from it abandons the write.
    using CommitHook = std::function<void(const std::string& tempPath)>;

    AtomicWriter() = default;
    explicit AtomicWriter(CommitHook beforeCommit);

    // Throws WriteError; the target is unmodified when it does.
    // mode < 0 keeps the target's permissions (0644 for a new file).
    // *committed is set once the rename has replaced the target, so a caller
    // catching an exception can tell whether the target changed.
    void write(const std::string& path, const std::string& content, int mode = -1,
               bool* committed = nullptr) const;

    // Delete temp files a crashed run left next to path. Returns the count.
    static size_t cleanupStaleTemps(const std::string& path);

    // Name prefix of temp files for path: ".<filename>.ssoprof-tmp-"
    static std::string tempPrefix(const std::string& path);

private:
    CommitHook m_beforeCommit;
};
