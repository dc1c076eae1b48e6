#include "gtest/gtest.h"
#include "test_helpers.h"
#include "errors.h"
#include "fs/atomic_writer.h"
#include "fs/backup_manager.h"
#include "fs/file_lock.h"
#include "fs/file_util.h"
#include "install/config_installer.h"

#include <chrono>
#include <stdexcept>

using namespace std::chrono_literals;

static const char* EXPECTED_FRESH =
    "[sso-session corp]\n"
    "sso_start_url = https://corp.awsapps.com/start\n"
    "sso_region = us-east-1\n"
    "sso_registration_scopes = sso:account:access\n"
    "\n"
    "[profile 111111111111-Admin]\n"
    "sso_session = corp\n"
    "sso_account_id = 111111111111\n"
    "sso_role_name = Admin\n"
    "region = us-east-1\n"
    "output = text\n"
    "\n"
    "[profile 222222222222-ReadOnly]\n"
    "sso_session = corp\n"
    "sso_account_id = 222222222222\n"
    "sso_role_name = ReadOnly\n"
    "region = us-east-1\n"
    "output = text\n";

static SsoSessionConfig corp_session() {
    SsoSessionConfig session;
    session.name = "corp";
    session.sso_start_url = "https://corp.awsapps.com/start";
    session.sso_region = "us-east-1";
    return session;
}

static std::vector<DesiredSection> fresh_desired() {
    std::vector<DesiredSection> desired{sso_session_section(corp_session())};
    for (auto& section : profile_sections("corp", {{"111111111111", "Admin", "us-east-1"},
                                                   {"222222222222", "ReadOnly", "us-east-1"}})) {
        desired.push_back(section);
    }
    return desired;
}

TEST(ConfigInstaller, EmptyFileEndToEnd) {
    TempDir dir;
    std::string path = dir.file("config");
    ConfigInstaller installer;

    ConfigInstallResult first = installer.apply(path, fresh_desired());
    ASSERT_TRUE(first.changed);
    ASSERT_TRUE(first.backup.isNull());
    ASSERT_EQ(read_text(path), EXPECTED_FRESH);
    ASSERT_EQ(first.document.sections.size(), 3u);
    ASSERT_EQ(first.report.added.size(), 3u);
    ASSERT_TRUE(BackupManager().list(path).empty());

    ConfigInstallResult second = installer.apply(path, fresh_desired());
    ASSERT_FALSE(second.changed);
    ASSERT_TRUE(second.backup.isNull());
    ASSERT_EQ(read_text(path), EXPECTED_FRESH);
    ASSERT_TRUE(BackupManager().list(path).empty());
}

TEST(ConfigInstaller, ChangeTakesBackupOfPreviousContent) {
    TempDir dir;
    std::string path = dir.file("config");
    std::string before = "[default]\nregion = eu-west-1\n";
    write_text(path, before);

    ConfigInstallResult result = ConfigInstaller().setSsoSession(path, corp_session());
    ASSERT_TRUE(result.changed);
    ASSERT_FALSE(result.backup.isNull());
    ASSERT_EQ(read_text(result.backup.backup_path), before);
    ASSERT_EQ(read_text(path).substr(0, before.size()), before);
}

TEST(ConfigInstaller, SyncRemovesRevokedRoles) {
    TempDir dir;
    std::string path = dir.file("config");
    ConfigInstaller installer;
    installer.setSsoSession(path, corp_session());
    installer.syncSessionProfiles(path, "corp", {{"111111111111", "A", "us-east-1"},
                                                 {"111111111111", "B", "us-east-1"}});

    ConfigInstallResult result =
        installer.syncSessionProfiles(path, "corp", {{"111111111111", "A", "us-east-1"}});
    ASSERT_TRUE(result.changed);
    ASSERT_EQ(result.report.removed, (std::vector<std::string>{"profile 111111111111-B"}));

    IniDocument doc = installer.load(path);
    ASSERT_NE(doc.find("profile 111111111111-A"), nullptr);
    ASSERT_EQ(doc.find("profile 111111111111-B"), nullptr);
    ASSERT_NE(doc.find("sso-session corp"), nullptr);
}

TEST(ConfigInstaller, SyncSessionIsOneWrite) {
    TempDir dir;
    std::string path = dir.file("config");
    write_text(path,
               "[default]\nregion = eu-west-1\n\n"
               "[sso-session corp]\nsso_start_url = https://old.awsapps.com/start\nsso_region = us-east-1\n\n"
               "[profile 111111111111-B]\nsso_session = corp\nsso_account_id = 111111111111\n"
               "sso_role_name = B\n");

    ConfigInstallResult result =
        ConfigInstaller().syncSession(path, corp_session(), {{"111111111111", "A", "us-east-1"}});
    ASSERT_TRUE(result.changed);
    ASSERT_FALSE(result.backup.isNull());
    ASSERT_EQ(BackupManager().list(path).size(), 1u);
    ASSERT_EQ(result.report.added, (std::vector<std::string>{"profile 111111111111-A"}));
    ASSERT_EQ(result.report.replaced, (std::vector<std::string>{"sso-session corp"}));
    ASSERT_EQ(result.report.removed, (std::vector<std::string>{"profile 111111111111-B"}));

    IniDocument doc = ConfigInstaller().load(path);
    ASSERT_EQ(doc.find("sso-session corp")->value("sso_start_url"), "https://corp.awsapps.com/start");
    ASSERT_NE(doc.find("default"), nullptr);

    ConfigInstallResult again =
        ConfigInstaller().syncSession(path, corp_session(), {{"111111111111", "A", "us-east-1"}});
    ASSERT_FALSE(again.changed);
    ASSERT_EQ(BackupManager().list(path).size(), 1u);
}

TEST(ConfigInstaller, RemoveSections) {
    TempDir dir;
    std::string path = dir.file("config");
    write_text(path, "[default]\nregion = eu-west-1\n\n[profile old]\nregion = x\n");

    ConfigInstallResult result = ConfigInstaller().removeSections(path, {"profile old"});
    ASSERT_TRUE(result.changed);
    ASSERT_EQ(read_text(path), "[default]\nregion = eu-west-1\n");
}

TEST(ConfigInstaller, MalformedFileIsNotTouched) {
    TempDir dir;
    std::string path = dir.file("config");
    std::string text = "region = us-east-1\n[default]\n";
    write_text(path, text);

    try {
        ConfigInstaller().setSsoSession(path, corp_session());
        FAIL() << "expected MalformedDocument";
    } catch (const MalformedDocument& e) {
        ASSERT_EQ(e.lineNumber(), 1u);
        ASSERT_EQ(e.rollbackState(), RollbackState::NotNeeded);
    }
    ASSERT_EQ(read_text(path), text);
    ASSERT_TRUE(BackupManager().list(path).empty());
}

TEST(ConfigInstaller, CrashBeforeCommitLeavesFileUnchanged) {
    TempDir dir;
    std::string path = dir.file("config");
    std::string before = "[default]\nregion = eu-west-1\n";
    write_text(path, before);

    TransactionOptions options;
    options.before_commit = [](const std::string&) { throw std::runtime_error("power cut"); };

    try {
        ConfigInstaller(options).setSsoSession(path, corp_session());
        FAIL() << "expected WriteError";
    } catch (const WriteError& e) {
        // The rename never happened, so there was nothing to roll back
        ASSERT_EQ(e.rollbackState(), RollbackState::NotNeeded);
        ASSERT_EQ(e.path(), path);
    }
    ASSERT_EQ(read_text(path), before);
    ASSERT_EQ(count_with_prefix(dir.entries(), AtomicWriter::tempPrefix(path)), 0u);
}

TEST(ConfigInstaller, FailureBeforeRenameDoesNotRestore) {
    TempDir dir;
    std::string path = dir.file("config");
    std::string before = "[default]\nregion = eu-west-1\n";
    write_text(path, before);

    // A restore would fail here because the snapshot is gone; it must not be attempted
    TransactionOptions options;
    options.before_commit = [&](const std::string&) {
        for (const auto& backup : BackupManager().list(path)) {
            std::filesystem::remove(backup.backup_path);
        }
        throw std::runtime_error("No space left on device");
    };

    try {
        ConfigInstaller(options).setSsoSession(path, corp_session());
        FAIL() << "expected WriteError";
    } catch (const WriteError& e) {
        ASSERT_EQ(e.rollbackState(), RollbackState::NotNeeded);
        ASSERT_NE(std::string(e.what()).find("No space left on device"), std::string::npos);
    }
    ASSERT_EQ(read_text(path), before);
}

TEST(ConfigInstaller, CrashOnNewFileLeavesNoFile) {
    TempDir dir;
    std::string path = dir.file("config");

    TransactionOptions options;
    options.before_commit = [](const std::string&) { throw std::runtime_error("power cut"); };

    try {
        ConfigInstaller(options).setSsoSession(path, corp_session());
        FAIL() << "expected WriteError";
    } catch (const WriteError& e) {
        ASSERT_EQ(e.rollbackState(), RollbackState::NotNeeded);
    }
    ASSERT_FALSE(file_exists(path));
    ASSERT_EQ(count_with_prefix(dir.entries(), AtomicWriter::tempPrefix(path)), 0u);
}

TEST(ConfigInstaller, LockHeldByOtherWriterTimesOut) {
    TempDir dir;
    std::string path = dir.file("config");
    write_text(path, "[default]\n");

    TransactionOptions options;
    options.lock_timeout = 50ms;

    FileLock other(path, 100ms);
    try {
        ConfigInstaller(options).setSsoSession(path, corp_session());
        FAIL() << "expected LockTimeoutError";
    } catch (const LockTimeoutError& e) {
        ASSERT_EQ(e.rollbackState(), RollbackState::NotNeeded);
    }
    ASSERT_EQ(read_text(path), "[default]\n");
}

TEST(ConfigInstaller, ConcurrentWriterSeesTimeoutAndFirstWriteWins) {
    TempDir dir;
    std::string path = dir.file("config");

    TransactionOptions inner;
    inner.lock_timeout = 50ms;
    bool innerTimedOut = false;

    // A second installer starts while the first one holds the lock
    InstallResult result = run_install_transaction(path, [&](const std::string& current) {
        try {
            ConfigInstaller(inner).setSsoSession(path, corp_session());
        } catch (const LockTimeoutError&) {
            innerTimedOut = true;
        }
        return current + "[default]\nregion = eu-west-1\n";
    }, TransactionOptions());

    ASSERT_TRUE(innerTimedOut);
    ASSERT_TRUE(result.changed);
    ASSERT_EQ(read_text(path), "[default]\nregion = eu-west-1\n");
}

TEST(ConfigInstaller, KeepsConfiguredNumberOfBackups) {
    TempDir dir;
    std::string path = dir.file("config");
    write_text(path, "[default]\n");

    TransactionOptions options;
    options.keep_backups = 2;
    ConfigInstaller installer(options);
    for (int i = 0; i < 5; ++i) {
        SsoSessionConfig session = corp_session();
        session.sso_start_url += std::to_string(i);
        installer.setSsoSession(path, session);
    }
    ASSERT_EQ(BackupManager().list(path).size(), 2u);
}

TEST(ConfigInstaller, LoadMissingFileIsEmpty) {
    TempDir dir;
    ASSERT_TRUE(ConfigInstaller().load(dir.file("nope")).empty());
}
