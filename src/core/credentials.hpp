#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

class CredentialManager {
public:
    static CredentialManager& instance();

    // Get credential by key
    Result<std::string> get(const std::string& key);

    // Set credential (<app data dir>/credentials, chmod 600)
    Result<void> set(const std::string& key, const std::string& value);

    // Remove credential
    Result<void> remove(const std::string& key);

    const std::filesystem::path& path() const { return path_; }

    // Point the store at another file (tests)
    void set_path(const std::filesystem::path& path) { path_ = path; }

private:
    CredentialManager();

    Result<std::string> get_impl(const std::string& key);
    Result<void> set_impl(const std::string& key, const std::string& value);
    Result<void> remove_impl(const std::string& key);

    std::filesystem::path path_;
};

// API key for service calls: $DOCSYNC_API_KEY wins over the stored key.
Result<std::string> resolve_api_key();
