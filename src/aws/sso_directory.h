#pragma once

#include <string>
#include <vector>

struct AccountRole {
    std::string account_id;
    std::string role_name;
};

// Source of the accounts and roles a signed-in SSO session can reach
class ISsoDirectory {
public:
    virtual ~ISsoDirectory() = default;

    // Returns false and sets error if the listing failed
    virtual bool listAccountRoles(const std::string& region, const std::string& accessToken,
                                  std::vector<AccountRole>& out, std::string& error) = 0;
};

// Lists through the installed AWS CLI (`aws sso list-accounts` and
// `aws sso list-account-roles`)
class AwsCliSsoDirectory : public ISsoDirectory {
public:
    explicit AwsCliSsoDirectory(std::string awsBinary = "aws");

    bool listAccountRoles(const std::string& region, const std::string& accessToken,
                          std::vector<AccountRole>& out, std::string& error) override;

private:
    std::string m_awsBinary;
};

// Parse `aws sso list-accounts --output json`
bool parse_account_list(const std::string& text, std::vector<std::string>& accountIds, std::string& error);

// Parse `aws sso list-account-roles --output json`
bool parse_role_list(const std::string& text, std::vector<std::string>& roleNames, std::string& error);
