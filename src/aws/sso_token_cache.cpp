#include "aws/sso_token_cache.h"
#include "loguru.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>

namespace fs = std::filesystem;

std::string sha1_hex(const std::string& input) {
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(input.c_str()), input.length(), hash);

    std::ostringstream oss;
    for (int i = 0; i < SHA_DIGEST_LENGTH; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

time_t parse_iso8601(const std::string& timestamp) {
    struct tm tm = {};
    std::istringstream ss(timestamp);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return 0;
    }
    return timegm(&tm);
}

SsoTokenCache::SsoTokenCache(std::string cacheDir)
    : m_cacheDir(std::move(cacheDir)) {}

std::string SsoTokenCache::defaultCacheDir(const std::string& home) {
    return home + "/.aws/sso/cache";
}

bool SsoTokenCache::readTokenFile(const std::string& path, SsoToken& token) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    try {
        nlohmann::json data = nlohmann::json::parse(file);
        if (!data.is_object() || !data.contains("accessToken")) {
            return false;
        }
        token.access_token = data.value("accessToken", "");
        token.region = data.value("region", "");
        token.start_url = data.value("startUrl", "");
        token.expires_at = parse_iso8601(data.value("expiresAt", ""));
        return !token.access_token.empty();
    } catch (const nlohmann::json::exception& e) {
        LOG_F(WARNING, "Failed to parse SSO cache file %s: %s", path.c_str(), e.what());
        return false;
    }
}

bool SsoTokenCache::findForSession(const std::string& sessionName, const std::string& region, SsoToken& token,
                                   time_t now) const {
    std::string sessionFile = m_cacheDir + "/" + sha1_hex(sessionName) + ".json";
    SsoToken candidate;
    if (readTokenFile(sessionFile, candidate)) {
        if (candidate.expires_at > 0 && now >= candidate.expires_at) {
            LOG_F(WARNING, "SSO token for session '%s' has expired", sessionName.c_str());
        } else {
            token = candidate;
            return true;
        }
    }

    // Older CLI versions key the cache by start URL; take the freshest token for the region
    bool found = false;
    std::error_code ec;
    fs::directory_iterator it(m_cacheDir, ec);
    if (ec) {
        LOG_F(WARNING, "SSO cache directory %s not readable: %s", m_cacheDir.c_str(), ec.message().c_str());
        return false;
    }
    for (const auto& entry : it) {
        if (entry.path().extension() != ".json") continue;

        SsoToken t;
        if (!readTokenFile(entry.path().string(), t)) continue;
        if (t.region != region) continue;
        if (t.expires_at > 0 && now >= t.expires_at) continue;
        if (!found || t.expires_at > token.expires_at) {
            token = t;
            found = true;
        }
    }

    if (!found) {
        LOG_F(WARNING, "No valid SSO token for session '%s' in %s", sessionName.c_str(), m_cacheDir.c_str());
    }
    return found;
}
