#include "gtest/gtest.h"
#include "test_helpers.h"
#include "errors.h"
#include "fs/backup_manager.h"
#include "fs/file_lock.h"
#include "fs/file_util.h"
#include "install/shell_installer.h"

#include <chrono>

using namespace std::chrono_literals;

static const std::string START = MarkedBlockEditor::DEFAULT_START;
static const std::string END = MarkedBlockEditor::DEFAULT_END;

TEST(ShellInstaller, InstallIntoExistingRcFile) {
    TempDir dir;
    std::string path = dir.file(".bashrc");
    write_text(path, "alias ll='ls -l'\n");

    ShellInstaller installer;
    InstallResult first = installer.install(path, "body\n");
    ASSERT_TRUE(first.changed);
    ASSERT_FALSE(first.backup.isNull());
    ASSERT_EQ(read_text(path), "alias ll='ls -l'\n\n" + START + "\nbody\n" + END + "\n");
    ASSERT_TRUE(installer.isInstalled(path));

    InstallResult second = installer.install(path, "body\n");
    ASSERT_FALSE(second.changed);
    ASSERT_EQ(BackupManager().list(path).size(), 1u);
}

TEST(ShellInstaller, UpdateReplacesBlock) {
    TempDir dir;
    std::string path = dir.file(".zshrc");
    ShellInstaller installer;
    installer.install(path, "v1\n");
    installer.install(path, "v2\n");
    ASSERT_EQ(read_text(path), START + "\nv2\n" + END + "\n");
}

TEST(ShellInstaller, Uninstall) {
    TempDir dir;
    std::string path = dir.file(".bashrc");
    write_text(path, "before\n");
    ShellInstaller installer;
    installer.install(path, "body\n");

    InstallResult removed = installer.uninstall(path);
    ASSERT_TRUE(removed.changed);
    ASSERT_EQ(read_text(path), "before\n\n");
    ASSERT_FALSE(installer.isInstalled(path));

    ASSERT_FALSE(installer.uninstall(path).changed);
    ASSERT_FALSE(installer.uninstall(dir.file("missing")).changed);
    ASSERT_FALSE(file_exists(dir.file("missing")));
}

TEST(ShellInstaller, UnbalancedMarkersAbortWithPath) {
    TempDir dir;
    std::string path = dir.file(".bashrc");
    std::string text = "x\n" + START + "\nhalf\n";
    write_text(path, text);

    try {
        ShellInstaller().install(path, "body\n");
        FAIL() << "expected MalformedDocument";
    } catch (const MalformedDocument& e) {
        ASSERT_EQ(e.path(), path);
        ASSERT_EQ(e.lineNumber(), 2u);
    }
    ASSERT_EQ(read_text(path), text);
}

TEST(ShellInstaller, InstallDetectedUsesShellStartupFile) {
    TempDir home;
    ShellEnvironment env{"/usr/bin/fish", home.path()};
    ScriptGenerator generator("/usr/bin/ssoprof");

    ShellInstaller installer;
    ShellInstallResult result = installer.installDetected(env, generator);
    ASSERT_EQ(result.shell, ShellKind::Fish);
    ASSERT_EQ(result.path, home.file(".config/fish/config.fish"));
    ASSERT_TRUE(result.changed);
    ASSERT_TRUE(result.backup.isNull());

    std::string content = read_text(result.path);
    ASSERT_EQ(installer.editor().extract(content), generator.fishBody());

    ShellInstallResult removed = installer.uninstallDetected(env);
    ASSERT_TRUE(removed.changed);
    ASSERT_EQ(read_text(result.path), "");
}

TEST(ShellInstaller, InstallDetectedRejectsUnsupportedShell) {
    TempDir home;
    ShellEnvironment env{"/bin/csh", home.path()};
    ASSERT_THROW(ShellInstaller().installDetected(env, ScriptGenerator("ssoprof")), UnsupportedShellError);
    ASSERT_TRUE(home.entries().empty());
}

TEST(ShellInstaller, LockedFileTimesOut) {
    TempDir dir;
    std::string path = dir.file(".bashrc");
    write_text(path, "x\n");

    TransactionOptions options;
    options.lock_timeout = 30ms;
    FileLock other(path, 100ms);
    ASSERT_THROW(ShellInstaller(options).install(path, "body\n"), LockTimeoutError);
    ASSERT_EQ(read_text(path), "x\n");
}
