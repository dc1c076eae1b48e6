#include "aws/sso_profiles.h"
#include "util/strings.h"
#include "loguru.hpp"

static const std::string SSO_SESSION_PREFIX = "sso-session ";
static const std::string PROFILE_PREFIX = "profile ";

std::string profile_name(const std::string& accountId, const std::string& roleName) {
    return accountId + "-" + roleName;
}

std::string sso_session_header(const std::string& sessionName) {
    return SSO_SESSION_PREFIX + sessionName;
}

std::string profile_header(const std::string& profileName) {
    return PROFILE_PREFIX + profileName;
}

DesiredSection sso_session_section(const SsoSessionConfig& session) {
    DesiredSection section;
    section.header = sso_session_header(session.name);
    section.entries = {
        {"sso_start_url", session.sso_start_url},
        {"sso_region", session.sso_region},
        {"sso_registration_scopes", session.sso_registration_scopes},
    };
    return section;
}

DesiredSection profile_section(const std::string& sessionName, const ProfileAssignment& assignment,
                               const std::string& output) {
    DesiredSection section;
    section.header = profile_header(profile_name(assignment.account_id, assignment.role_name));
    section.entries = {
        {"sso_session", sessionName},
        {"sso_account_id", assignment.account_id},
        {"sso_role_name", assignment.role_name},
        {"region", assignment.region},
        {"output", output},
    };
    return section;
}

std::vector<DesiredSection> profile_sections(const std::string& sessionName,
                                             const std::vector<ProfileAssignment>& assignments,
                                             const std::string& output) {
    std::vector<DesiredSection> sections;
    sections.reserve(assignments.size());
    for (const auto& assignment : assignments) {
        sections.push_back(profile_section(sessionName, assignment, output));
    }
    return sections;
}

std::vector<std::string> list_sso_sessions(const IniDocument& doc) {
    std::vector<std::string> names;
    for (const auto& section : doc.sections) {
        if (starts_with(section.header, SSO_SESSION_PREFIX)) {
            names.push_back(trim(section.header.substr(SSO_SESSION_PREFIX.size())));
        }
    }
    return names;
}

bool find_sso_session(const IniDocument& doc, const std::string& name, SsoSessionConfig& session) {
    const IniSection* section = doc.find(sso_session_header(name));
    if (!section) {
        return false;
    }
    session.name = name;
    session.sso_start_url = section->value("sso_start_url");
    session.sso_region = section->value("sso_region");
    if (section->hasKey("sso_registration_scopes")) {
        session.sso_registration_scopes = section->value("sso_registration_scopes");
    }
    return true;
}

// Fill in SSO settings from the sso-session a profile references
static void resolve_sso_session(AWSProfile& profile, const IniDocument& doc) {
    // Legacy inline SSO config takes precedence
    if (!profile.sso_start_url.empty() || profile.sso_session_name.empty()) {
        return;
    }

    SsoSessionConfig session;
    if (!find_sso_session(doc, profile.sso_session_name, session)) {
        LOG_F(WARNING, "Profile '%s' references sso_session '%s' but it doesn't exist",
              profile.name.c_str(), profile.sso_session_name.c_str());
        return;
    }
    profile.sso_start_url = session.sso_start_url;
    profile.sso_region = session.sso_region;
}

std::vector<AWSProfile> load_aws_profiles(const IniDocument& doc) {
    std::vector<AWSProfile> profiles;

    for (const auto& section : doc.sections) {
        AWSProfile profile;
        if (section.header == "default") {
            profile.name = "default";
        } else if (starts_with(section.header, PROFILE_PREFIX)) {
            profile.name = trim(section.header.substr(PROFILE_PREFIX.size()));
        } else {
            continue;
        }

        profile.region = section.value("region");
        profile.output = section.value("output");
        profile.sso_session_name = section.value("sso_session");
        profile.sso_start_url = section.value("sso_start_url");
        profile.sso_region = section.value("sso_region");
        profile.sso_account_id = section.value("sso_account_id");
        profile.sso_role_name = section.value("sso_role_name");

        resolve_sso_session(profile, doc);
        profiles.push_back(std::move(profile));
    }

    return profiles;
}
