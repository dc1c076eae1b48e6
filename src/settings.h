#pragma once

#include "aws/sso_profiles.h"
#include "install/install_transaction.h"

#include <functional>
#include <map>
#include <string>

struct AppSettings {
    std::string aws_config;              // empty: ~/.aws/config
    int backup_keep = 5;
    int lock_timeout_ms = 10000;
    std::string default_output = "text";
    std::map<std::string, SsoSessionConfig> sso_sessions;
};

// $SSOPROF_SETTINGS, else $XDG_CONFIG_HOME/ssoprof/settings.json,
// else ~/.config/ssoprof/settings.json. Empty if HOME is not set.
std::string settingsPath();

// Returns defaults if the file is missing or invalid
AppSettings loadSettings(const std::string& path);

// Throws SettingsError if text is not a valid settings object
AppSettings parseSettings(const std::string& text);

// Pretty-printed JSON as written to disk
std::string serializeSettings(const AppSettings& settings);

// Locked read-modify-write: change sees the settings currently on disk, so
// concurrent updates are applied one after the other and none is lost.
// Throws SettingsError if the file exists but is not valid settings (it is
// left untouched), WriteError or LockTimeoutError. Returns what was written.
AppSettings updateSettings(const std::string& path, const std::function<void(AppSettings&)>& change,
                           TransactionOptions options = {});

// Replaces the whole file, under the same lock as updateSettings
void saveSettings(const std::string& path, const AppSettings& settings, TransactionOptions options = {});

// $AWS_CONFIG_FILE, else settings.aws_config, else ~/.aws/config
std::string resolveAwsConfigPath(const AppSettings& settings, const std::string& home);

// Throws SettingsError naming the known sessions
const SsoSessionConfig& requireSession(const AppSettings& settings, const std::string& name);
