#pragma once

#include <ctime>
#include <string>

struct SsoToken {
    std::string access_token;
    std::string region;
    std::string start_url;
    time_t expires_at = 0;
};

// Read-only view of the tokens `aws sso login` leaves in ~/.aws/sso/cache
class SsoTokenCache {
public:
    explicit SsoTokenCache(std::string cacheDir);

    static std::string defaultCacheDir(const std::string& home);

    // Token for an sso-session: the AWS CLI v2 file named after the SHA1 of
    // the session name, else the newest unexpired token issued for region.
    bool findForSession(const std::string& sessionName, const std::string& region, SsoToken& token,
                        time_t now = time(nullptr)) const;

    const std::string& cacheDir() const { return m_cacheDir; }

private:
    bool readTokenFile(const std::string& path, SsoToken& token) const;

    std::string m_cacheDir;
};

std::string sha1_hex(const std::string& input);

// "2024-05-01T12:00:00Z" -> UTC time_t (0 on failure)
time_t parse_iso8601(const std::string& timestamp);
