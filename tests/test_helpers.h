#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

// Fresh directory under the system temp dir, removed with its contents
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::filesystem::path base = std::filesystem::temp_directory_path();
        do {
            m_path = base / ("ssoprof-test-" + std::to_string(rd()));
        } while (std::filesystem::exists(m_path));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return m_path.string(); }
    std::string file(const std::string& name) const { return (m_path / name).string(); }

    // Names of the entries in the directory
    std::vector<std::string> entries() const {
        std::vector<std::string> out;
        for (const auto& entry : std::filesystem::directory_iterator(m_path)) {
            out.push_back(entry.path().filename().string());
        }
        return out;
    }

private:
    std::filesystem::path m_path;
};

inline void write_text(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline size_t count_with_prefix(const std::vector<std::string>& names, const std::string& prefix) {
    size_t n = 0;
    for (const auto& name : names) {
        if (name.compare(0, prefix.size(), prefix) == 0) {
            ++n;
        }
    }
    return n;
}
