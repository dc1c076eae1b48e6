// ssoprof - generate AWS SSO profiles and a shell profile switcher
#include "errors.h"
#include "settings.h"
#include "aws/sso_directory.h"
#include "aws/sso_profiles.h"
#include "aws/sso_token_cache.h"
#include "install/config_installer.h"
#include "install/shell_installer.h"
#include "shell/script_generator.h"
#include "shell/shell_detector.h"
#include "loguru.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

static const char* VERSION = "0.3.0";

static void print_usage(std::ostream& out) {
    out << "Usage: ssoprof [-v] <command> [args]\n"
        << "\n"
        << "Commands:\n"
        << "  set <session> --start-url URL --region REGION [--scopes SCOPES]\n"
        << "                      Save an SSO session and write its [sso-session] section\n"
        << "  get [session]       Show saved SSO sessions\n"
        << "  profiles [session...]\n"
        << "                      Generate one profile per account role (all sessions by default)\n"
        << "  list                List profiles in the AWS config file\n"
        << "  select [profile]    Pick a profile and print its name\n"
        << "  install-shell [--shell bash|zsh|fish] [--file PATH]\n"
        << "                      Install the 'sp' profile switcher into your shell startup file\n"
        << "  uninstall-shell [--shell NAME] [--file PATH]\n"
        << "  shell-status [--shell NAME] [--file PATH]\n"
        << "\n"
        << "Options:\n"
        << "  -v, --verbose       Log to stderr\n"
        << "  -h, --help          Show this help\n"
        << "  --version           Show version\n";
}

static const char* rollback_text(const SsoprofError& e) {
    switch (e.rollbackState()) {
        case RollbackState::NotNeeded:
            return "No changes were made.";
        case RollbackState::RolledBack:
            return "The file was rolled back to its previous content.";
        case RollbackState::Failed:
            return "Rolling back FAILED; restore the file from its .ssoprof-backup_* copy.";
    }
    return "";
}

// Everything a command needs, resolved once in main
struct Context {
    ShellEnvironment env;
    std::string settings_path;
    AppSettings settings;
    std::string aws_config;

    TransactionOptions transactionOptions() const {
        TransactionOptions options;
        options.lock_timeout = std::chrono::milliseconds(settings.lock_timeout_ms);
        options.keep_backups = static_cast<size_t>(settings.backup_keep);
        return options;
    }
};

// Pulls "--name value" out of args; returns false if the flag is absent
static bool take_option(std::vector<std::string>& args, const std::string& name, std::string& value) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == name) {
            if (i + 1 >= args.size()) {
                throw SettingsError("Missing value for " + name, "");
            }
            value = args[i + 1];
            args.erase(args.begin() + i, args.begin() + i + 2);
            return true;
        }
        if (args[i].compare(0, name.size() + 1, name + "=") == 0) {
            value = args[i].substr(name.size() + 1);
            args.erase(args.begin() + i);
            return true;
        }
    }
    return false;
}

static void print_backup(const InstallResult& result) {
    if (!result.backup.isNull()) {
        std::cout << "Backup: " << result.backup.backup_path << "\n";
    }
}

static int cmd_set(Context& ctx, std::vector<std::string> args) {
    SsoSessionConfig session;
    take_option(args, "--start-url", session.sso_start_url);
    take_option(args, "--region", session.sso_region);
    take_option(args, "--scopes", session.sso_registration_scopes);
    if (args.size() != 1 || session.sso_start_url.empty() || session.sso_region.empty()) {
        std::cerr << "Usage: ssoprof set <session> --start-url URL --region REGION [--scopes SCOPES]\n";
        return 2;
    }
    session.name = args[0];

    ctx.settings = updateSettings(ctx.settings_path, [&](AppSettings& current) {
        current.sso_sessions[session.name] = session;
    }, ctx.transactionOptions());

    ConfigInstaller installer(ctx.transactionOptions());
    ConfigInstallResult result = installer.setSsoSession(ctx.aws_config, session);
    std::cout << "Saved sso session '" << session.name << "' to " << ctx.settings_path << "\n";
    std::cout << (result.changed ? "Updated " : "Already up to date: ") << ctx.aws_config << "\n";
    print_backup(result);
    std::cout << "Next: aws sso login --sso-session " << session.name << " && ssoprof profiles "
              << session.name << "\n";
    return 0;
}

static int cmd_get(Context& ctx, const std::vector<std::string>& args) {
    if (ctx.settings.sso_sessions.empty()) {
        std::cout << "No sso sessions configured. Add one with 'ssoprof set'.\n";
        return 0;
    }
    for (const auto& [name, session] : ctx.settings.sso_sessions) {
        if (!args.empty() && std::find(args.begin(), args.end(), name) == args.end()) {
            continue;
        }
        std::cout << "[" << name << "]\n"
                  << "  sso_start_url = " << session.sso_start_url << "\n"
                  << "  sso_region = " << session.sso_region << "\n"
                  << "  sso_registration_scopes = " << session.sso_registration_scopes << "\n";
    }
    for (const auto& name : args) {
        requireSession(ctx.settings, name);
    }
    return 0;
}

static int sync_session(Context& ctx, const SsoSessionConfig& session, const SsoTokenCache& cache,
                        ISsoDirectory& directory) {
    SsoToken token;
    if (!cache.findForSession(session.name, session.sso_region, token)) {
        std::cerr << "No valid SSO token for session '" << session.name << "'. Run:\n"
                  << "    aws sso login --sso-session " << session.name << "\n";
        return 1;
    }

    std::vector<AccountRole> roles;
    std::string error;
    if (!directory.listAccountRoles(session.sso_region, token.access_token, roles, error)) {
        // The config is left alone so a partial listing can't delete profiles
        std::cerr << "Failed to list accounts for session '" << session.name << "': " << error << "\n"
                  << "No changes were made.\n";
        return 1;
    }

    std::vector<ProfileAssignment> assignments;
    assignments.reserve(roles.size());
    for (const auto& role : roles) {
        assignments.push_back({role.account_id, role.role_name, session.sso_region});
    }

    ConfigInstaller installer(ctx.transactionOptions());
    ConfigInstallResult result = installer.syncSession(ctx.aws_config, session, assignments,
                                                       ctx.settings.default_output);

    std::cout << "Session '" << session.name << "': " << assignments.size() << " profiles; sections "
              << result.report.added.size() << " added, " << result.report.replaced.size() << " updated, "
              << result.report.removed.size() << " removed\n";
    for (const auto& header : result.report.added) {
        std::cout << "  + " << header << "\n";
    }
    for (const auto& header : result.report.removed) {
        std::cout << "  - " << header << "\n";
    }
    print_backup(result);
    return 0;
}

static int cmd_profiles(Context& ctx, const std::vector<std::string>& args) {
    std::vector<SsoSessionConfig> sessions;
    if (args.empty()) {
        for (const auto& [name, session] : ctx.settings.sso_sessions) {
            sessions.push_back(session);
        }
        if (sessions.empty()) {
            std::cerr << "No sso sessions configured. Add one with 'ssoprof set'.\n";
            return 1;
        }
    } else {
        for (const auto& name : args) {
            sessions.push_back(requireSession(ctx.settings, name));
        }
    }

    SsoTokenCache cache(SsoTokenCache::defaultCacheDir(ctx.env.home));
    AwsCliSsoDirectory directory;
    int rc = 0;
    for (const auto& session : sessions) {
        if (sync_session(ctx, session, cache, directory) != 0) {
            rc = 1;
        }
    }
    return rc;
}

static std::vector<AWSProfile> load_profiles(const Context& ctx) {
    ConfigInstaller installer(ctx.transactionOptions());
    return load_aws_profiles(installer.load(ctx.aws_config));
}

static int cmd_list(Context& ctx, const std::vector<std::string>&) {
    std::vector<AWSProfile> profiles = load_profiles(ctx);
    if (profiles.empty()) {
        std::cout << "No profiles in " << ctx.aws_config << "\n";
        return 0;
    }
    for (const auto& p : profiles) {
        std::cout << p.name;
        if (p.isSso()) {
            std::cout << "  (" << p.sso_account_id << " " << p.sso_role_name;
            if (!p.sso_session_name.empty()) {
                std::cout << ", session " << p.sso_session_name;
            }
            std::cout << ")";
        }
        std::cout << "\n";
    }
    return 0;
}

// stdout carries only the chosen name; the shell function captures it
static int cmd_select(Context& ctx, const std::vector<std::string>& args) {
    std::vector<AWSProfile> profiles = load_profiles(ctx);

    if (!args.empty()) {
        for (const auto& p : profiles) {
            if (p.name == args[0]) {
                std::cout << p.name << "\n";
                return 0;
            }
        }
        std::cerr << "Profile '" << args[0] << "' not found in " << ctx.aws_config << "\n";
        return 1;
    }

    if (profiles.empty()) {
        std::cerr << "No profiles in " << ctx.aws_config << ". Run 'ssoprof profiles' first.\n";
        return 1;
    }

    const char* current = std::getenv("AWS_PROFILE");
    for (size_t i = 0; i < profiles.size(); ++i) {
        bool active = current && profiles[i].name == current;
        std::cerr << (active ? "* " : "  ") << (i + 1) << ") " << profiles[i].name << "\n";
    }
    std::cerr << "Select profile [1-" << profiles.size() << "]: " << std::flush;

    std::string line;
    if (!std::getline(std::cin, line)) {
        std::cerr << "\n";
        return 1;
    }
    char* end = nullptr;
    long choice = std::strtol(line.c_str(), &end, 10);
    if (end == line.c_str() || choice < 1 || static_cast<size_t>(choice) > profiles.size()) {
        // Typing the name works too
        for (const auto& p : profiles) {
            if (p.name == line) {
                std::cout << p.name << "\n";
                return 0;
            }
        }
        std::cerr << "Invalid selection: " << line << "\n";
        return 1;
    }
    std::cout << profiles[static_cast<size_t>(choice - 1)].name << "\n";
    return 0;
}

// Resolve --shell/--file into a shell kind and startup file
static void resolve_shell_target(const Context& ctx, std::vector<std::string>& args, ShellKind& kind,
                                 std::string& file) {
    std::string shell;
    ShellEnvironment env = ctx.env;
    if (take_option(args, "--shell", shell)) {
        env.shell = shell;
    }
    kind = detect_shell(env);
    if (take_option(args, "--file", file)) {
        if (kind == ShellKind::Unsupported) {
            throw UnsupportedShellError(env.shell, supported_shells());
        }
        return;
    }
    file = shell_config_file(kind, env);
}

static int cmd_install_shell(Context& ctx, std::vector<std::string> args) {
    ShellKind kind;
    std::string file;
    resolve_shell_target(ctx, args, kind, file);

    ScriptGenerator generator(ScriptGenerator::currentExecutable());
    ShellInstaller installer(ctx.transactionOptions());
    InstallResult result = installer.install(file, generator.bodyFor(kind));

    if (result.changed) {
        std::cout << "Installed the 'sp' function for " << shell_kind_name(kind) << " in " << file << "\n";
        print_backup(result);
    } else {
        std::cout << "The 'sp' function is already up to date in " << file << "\n";
    }
    std::cout << generator.installationInstructions(kind, file);
    return 0;
}

static int cmd_uninstall_shell(Context& ctx, std::vector<std::string> args) {
    ShellKind kind;
    std::string file;
    resolve_shell_target(ctx, args, kind, file);

    ShellInstaller installer(ctx.transactionOptions());
    InstallResult result = installer.uninstall(file);
    if (result.changed) {
        std::cout << "Removed the 'sp' function from " << file << "\n";
        print_backup(result);
    } else {
        std::cout << "The 'sp' function is not installed in " << file << "\n";
    }
    return 0;
}

static int cmd_shell_status(Context& ctx, std::vector<std::string> args) {
    ShellKind kind;
    std::string file;
    resolve_shell_target(ctx, args, kind, file);

    ShellInstaller installer(ctx.transactionOptions());
    bool installed = installer.isInstalled(file);
    std::cout << "Shell: " << shell_kind_name(kind) << "\n"
              << "Startup file: " << file << "\n"
              << "Installed: " << (installed ? "yes" : "no") << "\n";
    return installed ? 0 : 1;
}

int main(int argc, char* argv[])
{
    // Filter our own flags before passing the rest to loguru
    bool verbose = false;
    std::vector<std::string> args;
    std::vector<char*> filtered_argv;
    filtered_argv.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(std::cout);
            return 0;
        } else if (strcmp(argv[i], "--version") == 0) {
            std::cout << "ssoprof " << VERSION << "\n";
            return 0;
        } else {
            args.push_back(argv[i]);
        }
    }
    filtered_argv.push_back(nullptr);
    int filtered_argc = static_cast<int>(filtered_argv.size()) - 1;

    if (args.empty()) {
        print_usage(std::cerr);
        return 2;
    }

    // Logging - stderr off by default, file always on
    loguru::g_stderr_verbosity = verbose ? loguru::Verbosity_INFO : loguru::Verbosity_OFF;
    loguru::init(filtered_argc, filtered_argv.data());

    Context ctx;
    ctx.env = ShellEnvironment::fromProcess();
    if (!ctx.env.home.empty()) {
        std::string logPath = ctx.env.home + "/.cache/ssoprof/ssoprof.log";
        if (!loguru::add_file(logPath.c_str(), loguru::Append, loguru::Verbosity_INFO)) {
            LOG_F(WARNING, "Cannot open log file %s", logPath.c_str());
        }
    }

    std::string command = args.front();
    args.erase(args.begin());
    LOG_F(INFO, "ssoprof %s starting: %s", VERSION, command.c_str());

    try {
        ctx.settings_path = settingsPath();
        ctx.settings = loadSettings(ctx.settings_path);
        ctx.aws_config = resolveAwsConfigPath(ctx.settings, ctx.env.home);

        if (command == "set") return cmd_set(ctx, args);
        if (command == "get") return cmd_get(ctx, args);
        if (command == "profiles") return cmd_profiles(ctx, args);
        if (command == "list") return cmd_list(ctx, args);
        if (command == "select") return cmd_select(ctx, args);
        if (command == "install-shell") return cmd_install_shell(ctx, args);
        if (command == "uninstall-shell") return cmd_uninstall_shell(ctx, args);
        if (command == "shell-status") return cmd_shell_status(ctx, args);

        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(std::cerr);
        return 2;
    } catch (const SsoprofError& e) {
        LOG_F(ERROR, "%s failed: %s", command.c_str(), e.what());
        std::cerr << "Error: " << e.what() << "\n";
        if (!e.path().empty()) {
            std::cerr << "File: " << e.path() << "\n";
        }
        std::cerr << rollback_text(e) << "\n";
        if (dynamic_cast<const LockTimeoutError*>(&e)) {
            std::cerr << "Another ssoprof is updating this file; try again shortly.\n";
        }
        return 1;
    } catch (const std::exception& e) {
        LOG_F(ERROR, "%s failed: %s", command.c_str(), e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
