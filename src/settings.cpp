#include "settings.h"
#include "errors.h"
#include "fs/file_util.h"
#include "util/strings.h"
#include "loguru.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <sys/stat.h>

using json = nlohmann::json;

static std::string getSettingsDir() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && xdg_config[0] != '\0') {
        return std::string(xdg_config) + "/ssoprof";
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return "";
    }
    return std::string(home) + "/.config/ssoprof";
}

static bool createDirRecursive(const std::string& dir) {
    struct stat st;
    if (stat(dir.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }

    size_t pos = dir.rfind('/');
    if (pos != std::string::npos && pos > 0) {
        std::string parent = dir.substr(0, pos);
        if (!createDirRecursive(parent)) {
            return false;
        }
    }

    return mkdir(dir.c_str(), 0755) == 0;
}

std::string settingsPath() {
    const char* override_path = std::getenv("SSOPROF_SETTINGS");
    if (override_path && override_path[0] != '\0') {
        return override_path;
    }
    std::string dir = getSettingsDir();
    if (dir.empty()) {
        return "";
    }
    return dir + "/settings.json";
}

AppSettings parseSettings(const std::string& text) {
    AppSettings settings;

    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        throw SettingsError(std::string("Invalid settings JSON: ") + e.what(), "");
    }
    if (!j.is_object()) {
        throw SettingsError("Settings must be a JSON object", "");
    }

    try {
        settings.aws_config = j.value("aws_config", "");
        settings.backup_keep = j.value("backup_keep", settings.backup_keep);
        settings.lock_timeout_ms = j.value("lock_timeout_ms", settings.lock_timeout_ms);
        settings.default_output = j.value("default_output", settings.default_output);
    } catch (const json::exception& e) {
        throw SettingsError(std::string("Invalid settings value: ") + e.what(), "");
    }
    if (settings.backup_keep < 1) {
        LOG_F(WARNING, "backup_keep %d is too small, using 1", settings.backup_keep);
        settings.backup_keep = 1;
    }
    if (settings.lock_timeout_ms < 0) {
        settings.lock_timeout_ms = 0;
    }

    if (j.contains("sso_sessions") && j["sso_sessions"].is_object()) {
        for (auto& [name, entry] : j["sso_sessions"].items()) {
            if (!entry.is_object()) {
                LOG_F(WARNING, "Ignoring sso session %s: not an object", name.c_str());
                continue;
            }
            SsoSessionConfig session;
            session.name = name;
            session.sso_start_url = entry.value("sso_start_url", "");
            session.sso_region = entry.value("sso_region", "");
            session.sso_registration_scopes = entry.value("sso_registration_scopes",
                                                          session.sso_registration_scopes);
            if (session.sso_start_url.empty() || session.sso_region.empty()) {
                LOG_F(WARNING, "Ignoring sso session %s: sso_start_url and sso_region are required",
                      name.c_str());
                continue;
            }
            settings.sso_sessions[name] = std::move(session);
        }
    }
    return settings;
}

AppSettings loadSettings(const std::string& path) {
    if (path.empty()) {
        LOG_F(INFO, "Cannot determine settings path (HOME not set)");
        return AppSettings();
    }

    std::string text;
    std::string err;
    if (!file_exists(path)) {
        LOG_F(INFO, "No settings file found at %s", path.c_str());
        return AppSettings();
    }
    if (!read_file(path, text, &err)) {
        LOG_F(WARNING, "Failed to read settings file %s: %s", path.c_str(), err.c_str());
        return AppSettings();
    }

    try {
        AppSettings settings = parseSettings(text);
        LOG_F(INFO, "Loaded settings from %s: %zu sso sessions", path.c_str(), settings.sso_sessions.size());
        return settings;
    } catch (const SettingsError& e) {
        LOG_F(WARNING, "Failed to parse settings file %s: %s", path.c_str(), e.what());
        return AppSettings();
    }
}

std::string serializeSettings(const AppSettings& settings) {
    json j;
    j["aws_config"] = settings.aws_config;
    j["backup_keep"] = settings.backup_keep;
    j["lock_timeout_ms"] = settings.lock_timeout_ms;
    j["default_output"] = settings.default_output;
    j["sso_sessions"] = json::object();
    for (const auto& [name, session] : settings.sso_sessions) {
        j["sso_sessions"][name] = {
            {"sso_start_url", session.sso_start_url},
            {"sso_region", session.sso_region},
            {"sso_registration_scopes", session.sso_registration_scopes},
        };
    }
    return j.dump(2) + "\n";
}

AppSettings updateSettings(const std::string& path, const std::function<void(AppSettings&)>& change,
                           TransactionOptions options) {
    if (path.empty()) {
        throw SettingsError("Cannot determine settings path (HOME not set)", path);
    }
    // The lock file lives next to the settings, so the directory must exist first
    size_t slash = path.rfind('/');
    if (slash != std::string::npos && slash > 0) {
        std::string dir = path.substr(0, slash);
        if (!createDirRecursive(dir)) {
            throw WriteError("Failed to create settings directory " + dir, path);
        }
    }

    options.mode = 0600;
    AppSettings updated;
    run_install_transaction(path, [&](const std::string& current) {
        updated = AppSettings();
        if (!trim(current).empty()) {
            try {
                updated = parseSettings(current);
            } catch (const SettingsError& e) {
                // Rewriting would drop whatever the user had in there
                throw SettingsError(std::string(e.what()) + " in " + path, path);
            }
        }
        change(updated);
        return serializeSettings(updated);
    }, options);

    LOG_F(INFO, "Saved settings to %s: %zu sso sessions", path.c_str(), updated.sso_sessions.size());
    return updated;
}

void saveSettings(const std::string& path, const AppSettings& settings, TransactionOptions options) {
    updateSettings(path, [&](AppSettings& current) { current = settings; }, std::move(options));
}

std::string resolveAwsConfigPath(const AppSettings& settings, const std::string& home) {
    const char* env = std::getenv("AWS_CONFIG_FILE");
    if (env && env[0] != '\0') {
        return expand_home(env, home);
    }
    if (!settings.aws_config.empty()) {
        return expand_home(settings.aws_config, home);
    }
    return home + "/.aws/config";
}

const SsoSessionConfig& requireSession(const AppSettings& settings, const std::string& name) {
    auto it = settings.sso_sessions.find(name);
    if (it != settings.sso_sessions.end()) {
        return it->second;
    }
    std::string known;
    for (const auto& [key, session] : settings.sso_sessions) {
        if (!known.empty()) known += ", ";
        known += key;
    }
    throw SettingsError("Unknown sso session '" + name + "'" +
                        (known.empty() ? std::string(" (no sessions configured; run `ssoprof set`)")
                                       : " (known: " + known + ")"),
                        "");
}
