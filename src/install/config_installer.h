#pragma once

#include "aws/sso_profiles.h"
#include "config/ini_document.h"
#include "config/section_reconciler.h"
#include "install/install_transaction.h"

#include <string>
#include <vector>

struct ConfigInstallResult : InstallResult {
    IniDocument document;    // config as it is on disk after the call
    ReconcileReport report;
};

// Applies desired sections to an AWS-style config file transactionally
class ConfigInstaller {
public:
    explicit ConfigInstaller(TransactionOptions options = {});

    // Reconcile the file against desired (see reconcile_sections)
    ConfigInstallResult apply(const std::string& path, const std::vector<DesiredSection>& desired,
                              const PruneScope* scope = nullptr) const;

    // Write or replace the [sso-session NAME] section
    ConfigInstallResult setSsoSession(const std::string& path, const SsoSessionConfig& session) const;

    // Make the session's generated profiles exactly match assignments:
    // new roles are added, changed ones replaced, revoked ones removed.
    ConfigInstallResult syncSessionProfiles(const std::string& path, const std::string& sessionName,
                                            const std::vector<ProfileAssignment>& assignments,
                                            const std::string& output = "text") const;

    // setSsoSession and syncSessionProfiles in one transaction: a single
    // write, a single backup and one report covering both
    ConfigInstallResult syncSession(const std::string& path, const SsoSessionConfig& session,
                                    const std::vector<ProfileAssignment>& assignments,
                                    const std::string& output = "text") const;

    ConfigInstallResult removeSections(const std::string& path, const std::vector<std::string>& headers) const;

    // Parse the file without locking or writing (empty document if absent)
    IniDocument load(const std::string& path) const;

    const TransactionOptions& options() const { return m_options; }

private:
    ConfigInstallResult run(const std::string& path,
                            const std::function<IniDocument(const IniDocument&, ReconcileReport&)>& change) const;

    TransactionOptions m_options;
};
