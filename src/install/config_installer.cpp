#include "install/config_installer.h"
#include "errors.h"
#include "fs/file_util.h"
#include "loguru.hpp"

ConfigInstaller::ConfigInstaller(TransactionOptions options)
    : m_options(std::move(options)) {}

ConfigInstallResult ConfigInstaller::run(
    const std::string& path,
    const std::function<IniDocument(const IniDocument&, ReconcileReport&)>& change) const {
    ConfigInstallResult result;

    auto transform = [&](const std::string& current) {
        IniDocument before = parse_ini_document(current, path);
        result.document = change(before, result.report);
        return serialize_ini_document(result.document);
    };

    InstallResult base = run_install_transaction(path, transform, m_options);
    result.path = base.path;
    result.changed = base.changed;
    result.backup = base.backup;

    LOG_F(INFO, "%s: %zu added, %zu replaced, %zu removed%s", path.c_str(),
          result.report.added.size(), result.report.replaced.size(), result.report.removed.size(),
          result.changed ? "" : " (no changes)");
    return result;
}

ConfigInstallResult ConfigInstaller::apply(const std::string& path, const std::vector<DesiredSection>& desired,
                                           const PruneScope* scope) const {
    return run(path, [&](const IniDocument& current, ReconcileReport& report) {
        return reconcile_sections(current, desired, scope, &report);
    });
}

ConfigInstallResult ConfigInstaller::setSsoSession(const std::string& path, const SsoSessionConfig& session) const {
    return apply(path, {sso_session_section(session)});
}

ConfigInstallResult ConfigInstaller::syncSessionProfiles(const std::string& path, const std::string& sessionName,
                                                         const std::vector<ProfileAssignment>& assignments,
                                                         const std::string& output) const {
    PruneScope scope{sessionName};
    return apply(path, profile_sections(sessionName, assignments, output), &scope);
}

ConfigInstallResult ConfigInstaller::syncSession(const std::string& path, const SsoSessionConfig& session,
                                                 const std::vector<ProfileAssignment>& assignments,
                                                 const std::string& output) const {
    // The session section goes first so the profiles can reference it
    std::vector<DesiredSection> desired{sso_session_section(session)};
    for (auto& section : profile_sections(session.name, assignments, output)) {
        desired.push_back(std::move(section));
    }
    PruneScope scope{session.name};
    return apply(path, desired, &scope);
}

ConfigInstallResult ConfigInstaller::removeSections(const std::string& path,
                                                    const std::vector<std::string>& headers) const {
    return run(path, [&](const IniDocument& current, ReconcileReport& report) {
        return remove_sections(current, headers, &report);
    });
}

IniDocument ConfigInstaller::load(const std::string& path) const {
    if (!file_exists(path)) {
        return IniDocument();
    }
    std::string content;
    std::string err;
    if (!read_file(path, content, &err)) {
        throw WriteError("Cannot read " + path + ": " + err, path);
    }
    return parse_ini_document(content, path);
}
