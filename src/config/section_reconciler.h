#pragma once

#include "config/ini_document.h"
#include <string>
#include <vector>

// Target state for one section. Replaces any existing section with the same
// header as a whole; fields are never merged.
struct DesiredSection {
    std::string header;
    IniEntries entries;
};

// Limits stale-profile deletion to the generated profiles of one SSO session
struct PruneScope {
    std::string sso_session;
};

// What reconciliation did, for reporting back to the user
struct ReconcileReport {
    std::vector<std::string> added;
    std::vector<std::string> replaced;  // existing sections whose content changed
    std::vector<std::string> removed;

    bool changed() const { return !added.empty() || !replaced.empty() || !removed.empty(); }
};

// Compute the document that results from ensuring every desired section is
// present. Existing sections with a desired header are replaced in place,
// new ones are appended in caller order, and everything else keeps its
// position and bytes. With a scope, generated profiles of that session that
// are no longer desired are removed. Pure; `report` may be null.
IniDocument reconcile_sections(const IniDocument& current,
                               const std::vector<DesiredSection>& desired,
                               const PruneScope* scope = nullptr,
                               ReconcileReport* report = nullptr);

// Remove every section whose header is listed. Pure; `report` may be null.
IniDocument remove_sections(const IniDocument& current,
                            const std::vector<std::string>& headers,
                            ReconcileReport* report = nullptr);

// "profile <12-digit account id>-<role>", the naming scheme of generated profiles
bool is_generated_profile_header(const std::string& header);
