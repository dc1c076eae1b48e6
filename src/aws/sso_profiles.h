#pragma once

#include "config/ini_document.h"
#include "config/section_reconciler.h"

#include <string>
#include <vector>

// An [sso-session NAME] definition
struct SsoSessionConfig {
    std::string name;
    std::string sso_start_url;
    std::string sso_region;
    std::string sso_registration_scopes = "sso:account:access";
};

// One role the user can assume, as reported for a session
struct ProfileAssignment {
    std::string account_id;
    std::string role_name;
    std::string region;
};

// A profile section read back from the config file
struct AWSProfile {
    std::string name;
    std::string region;
    std::string output;

    std::string sso_session_name;
    std::string sso_start_url;   // resolved through the sso-session section
    std::string sso_region;
    std::string sso_account_id;
    std::string sso_role_name;

    bool isSso() const { return !sso_account_id.empty() && !sso_role_name.empty(); }
};

// "<account_id>-<role_name>"
std::string profile_name(const std::string& accountId, const std::string& roleName);

std::string sso_session_header(const std::string& sessionName);
std::string profile_header(const std::string& profileName);

DesiredSection sso_session_section(const SsoSessionConfig& session);
DesiredSection profile_section(const std::string& sessionName, const ProfileAssignment& assignment,
                               const std::string& output = "text");
std::vector<DesiredSection> profile_sections(const std::string& sessionName,
                                             const std::vector<ProfileAssignment>& assignments,
                                             const std::string& output = "text");

// Names of all [sso-session ...] sections, in file order
std::vector<std::string> list_sso_sessions(const IniDocument& doc);

// The [sso-session NAME] section's settings; false if there is none
bool find_sso_session(const IniDocument& doc, const std::string& name, SsoSessionConfig& session);

// Every [profile ...] and [default] section, in file order
std::vector<AWSProfile> load_aws_profiles(const IniDocument& doc);
