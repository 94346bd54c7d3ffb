#include "../credentials.hpp"
#include <fstream>
#include <map>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

// Credentials stored as simple key=value lines in the app data dir
// File is chmod 600.

static std::map<std::string, std::string> read_all(const fs::path& path) {
    std::map<std::string, std::string> m;
    std::ifstream f(path);
    if (!f) return m;

    std::string line;
    while (std::getline(f, line)) {
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            m[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return m;
}

static bool write_all(const fs::path& path, const std::map<std::string, std::string>& m) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) return false;

    std::ofstream f(path, std::ios::trunc);
    if (!f) return false;

    for (const auto& [k, v] : m) {
        f << k << "=" << v << "\n";
    }
    f.close();

    chmod(path.c_str(), 0600);
    return true;
}

Result<std::string> CredentialManager::get_impl(const std::string& key) {
    auto m = read_all(path_);
    auto it = m.find(key);
    if (it == m.end()) {
        return Result<std::string>::Err("Credential not found");
    }
    return Result<std::string>::Ok(it->second);
}

Result<void> CredentialManager::set_impl(const std::string& key, const std::string& value) {
    auto m = read_all(path_);
    m[key] = value;
    if (!write_all(path_, m)) {
        return Result<void>::Err("Failed to write credentials file " + path_.string());
    }
    return Result<void>::Ok();
}

Result<void> CredentialManager::remove_impl(const std::string& key) {
    auto m = read_all(path_);
    if (m.erase(key) == 0) {
        return Result<void>::Err("Credential not found");
    }
    if (!write_all(path_, m)) {
        return Result<void>::Err("Failed to write credentials file " + path_.string());
    }
    return Result<void>::Ok();
}
