#include "gtest/gtest.h"
#include "aws/sso_profiles.h"

TEST(SsoProfiles, Names) {
    ASSERT_EQ(profile_name("123456789012", "AdminRole"), "123456789012-AdminRole");
    ASSERT_EQ(profile_header("123456789012-AdminRole"), "profile 123456789012-AdminRole");
    ASSERT_EQ(sso_session_header("corp"), "sso-session corp");
}

TEST(SsoProfiles, SessionSectionKeyOrder) {
    SsoSessionConfig session{"corp", "https://corp.awsapps.com/start", "eu-central-1"};
    DesiredSection section = sso_session_section(session);
    ASSERT_EQ(section.header, "sso-session corp");
    ASSERT_EQ(section.entries, (IniEntries{{"sso_start_url", "https://corp.awsapps.com/start"},
                                           {"sso_region", "eu-central-1"},
                                           {"sso_registration_scopes", "sso:account:access"}}));
}

TEST(SsoProfiles, ProfileSectionKeyOrder) {
    DesiredSection section = profile_section("corp", {"123456789012", "ReadOnly", "eu-central-1"}, "json");
    ASSERT_EQ(section.header, "profile 123456789012-ReadOnly");
    ASSERT_EQ(section.entries, (IniEntries{{"sso_session", "corp"},
                                           {"sso_account_id", "123456789012"},
                                           {"sso_role_name", "ReadOnly"},
                                           {"region", "eu-central-1"},
                                           {"output", "json"}}));
    ASSERT_TRUE(is_generated_profile_header(section.header));
}

TEST(SsoProfiles, ProfileSectionsKeepOrder) {
    std::vector<DesiredSection> sections = profile_sections(
        "corp", {{"222222222222", "B", "us-east-1"}, {"111111111111", "A", "us-east-1"}});
    ASSERT_EQ(sections.size(), 2u);
    ASSERT_EQ(sections[0].header, "profile 222222222222-B");
    ASSERT_EQ(sections[1].entries.back(), (std::pair<std::string, std::string>{"output", "text"}));
}

TEST(SsoProfiles, ReadBackFromDocument) {
    IniDocument doc = parse_ini_document(
        "[default]\n"
        "region = eu-west-1\n"
        "\n"
        "[sso-session corp]\n"
        "sso_start_url = https://corp.awsapps.com/start\n"
        "sso_region = us-east-1\n"
        "\n"
        "[profile 123456789012-Admin]\n"
        "sso_session = corp\n"
        "sso_account_id = 123456789012\n"
        "sso_role_name = Admin\n"
        "region = us-west-2\n"
        "\n"
        "[profile legacy]\n"
        "sso_start_url = https://legacy.awsapps.com/start\n"
        "sso_region = eu-west-1\n"
        "sso_account_id = 999999999999\n"
        "sso_role_name = Dev\n"
        "\n"
        "[profile dangling]\n"
        "sso_session = missing\n"
        "sso_account_id = 1\n"
        "sso_role_name = x\n");

    ASSERT_EQ(list_sso_sessions(doc), (std::vector<std::string>{"corp"}));

    SsoSessionConfig session;
    ASSERT_TRUE(find_sso_session(doc, "corp", session));
    ASSERT_EQ(session.sso_start_url, "https://corp.awsapps.com/start");
    ASSERT_EQ(session.sso_registration_scopes, "sso:account:access");
    ASSERT_FALSE(find_sso_session(doc, "other", session));

    std::vector<AWSProfile> profiles = load_aws_profiles(doc);
    ASSERT_EQ(profiles.size(), 4u);
    ASSERT_EQ(profiles[0].name, "default");
    ASSERT_FALSE(profiles[0].isSso());

    ASSERT_EQ(profiles[1].name, "123456789012-Admin");
    ASSERT_TRUE(profiles[1].isSso());
    ASSERT_EQ(profiles[1].sso_start_url, "https://corp.awsapps.com/start");
    ASSERT_EQ(profiles[1].sso_region, "us-east-1");
    ASSERT_EQ(profiles[1].region, "us-west-2");

    ASSERT_EQ(profiles[2].sso_start_url, "https://legacy.awsapps.com/start");
    ASSERT_EQ(profiles[3].sso_start_url, "");
}
