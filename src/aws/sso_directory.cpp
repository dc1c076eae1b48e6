#include "aws/sso_directory.h"
#include "util/process.h"
#include "loguru.hpp"

#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

using json = nlohmann::json;

// Request parameters for `--cli-input-json file://...`. The access token
// goes through a 0600 file so it never shows up in another user's `ps`.
// The file is unlinked when this goes out of scope.
class CliInputFile {
public:
    CliInputFile() = default;
    ~CliInputFile() {
        if (!m_path.empty()) {
            unlink(m_path.c_str());
        }
    }
    CliInputFile(const CliInputFile&) = delete;
    CliInputFile& operator=(const CliInputFile&) = delete;

    bool write(const json& input, std::string& error) {
        const char* tmp = std::getenv("TMPDIR");
        std::string pattern = std::string(tmp && tmp[0] != '\0' ? tmp : "/tmp") + "/ssoprof-sso-XXXXXX";
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');

        // mkstemp creates the file with mode 0600
        int fd = mkstemp(name.data());
        if (fd < 0) {
            error = std::string("cannot create request file: ") + strerror(errno);
            return false;
        }
        m_path = name.data();

        std::string text = input.dump();
        size_t offset = 0;
        while (offset < text.size()) {
            ssize_t n = ::write(fd, text.data() + offset, text.size() - offset);
            if (n < 0) {
                if (errno == EINTR) continue;
                error = std::string("cannot write request file: ") + strerror(errno);
                close(fd);
                return false;
            }
            offset += static_cast<size_t>(n);
        }
        if (close(fd) != 0) {
            error = std::string("cannot write request file: ") + strerror(errno);
            return false;
        }
        return true;
    }

    std::string argument() const { return "file://" + m_path; }

private:
    std::string m_path;
};

static bool parse_string_field_list(const std::string& text, const char* listKey, const char* field,
                                    std::vector<std::string>& out, std::string& error) {
    try {
        json j = json::parse(text);
        if (!j.contains(listKey) || !j[listKey].is_array()) {
            error = std::string("response has no ") + listKey;
            return false;
        }
        for (const auto& item : j[listKey]) {
            if (item.is_object() && item.contains(field) && item[field].is_string()) {
                out.push_back(item[field].get<std::string>());
            }
        }
        return true;
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }
}

bool parse_account_list(const std::string& text, std::vector<std::string>& accountIds, std::string& error) {
    return parse_string_field_list(text, "accountList", "accountId", accountIds, error);
}

bool parse_role_list(const std::string& text, std::vector<std::string>& roleNames, std::string& error) {
    return parse_string_field_list(text, "roleList", "roleName", roleNames, error);
}

AwsCliSsoDirectory::AwsCliSsoDirectory(std::string awsBinary)
    : m_awsBinary(std::move(awsBinary)) {}

bool AwsCliSsoDirectory::listAccountRoles(const std::string& region, const std::string& accessToken,
                                          std::vector<AccountRole>& out, std::string& error) {
    int rc = 0;
    CliInputFile accountsInput;
    if (!accountsInput.write({{"accessToken", accessToken}}, error)) {
        return false;
    }
    std::string accountsJson = run_command_capture(
        {m_awsBinary, "sso", "list-accounts", "--cli-input-json", accountsInput.argument(),
         "--region", region, "--output", "json"}, &rc);
    if (rc != 0) {
        error = "aws sso list-accounts failed with exit code " + std::to_string(rc);
        return false;
    }

    std::vector<std::string> accountIds;
    if (!parse_account_list(accountsJson, accountIds, error)) {
        return false;
    }
    LOG_F(INFO, "SSO directory returned %zu account(s) in %s", accountIds.size(), region.c_str());

    for (const auto& accountId : accountIds) {
        CliInputFile rolesInput;
        if (!rolesInput.write({{"accessToken", accessToken}, {"accountId", accountId}}, error)) {
            return false;
        }
        std::string rolesJson = run_command_capture(
            {m_awsBinary, "sso", "list-account-roles", "--cli-input-json", rolesInput.argument(),
             "--region", region, "--output", "json"}, &rc);
        if (rc != 0) {
            error = "aws sso list-account-roles failed for account " + accountId +
                    " with exit code " + std::to_string(rc);
            return false;
        }

        std::vector<std::string> roles;
        if (!parse_role_list(rolesJson, roles, error)) {
            error = "account " + accountId + ": " + error;
            return false;
        }
        for (const auto& role : roles) {
            out.push_back({accountId, role});
        }
    }
    return true;
}
