#include "credentials.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <cstdlib>

CredentialManager& CredentialManager::instance() {
    static CredentialManager mgr;
    return mgr;
}

CredentialManager::CredentialManager()
    : path_(platform::app_data_dir() / "credentials") {}

Result<std::string> CredentialManager::get(const std::string& key) {
    return get_impl(key);
}

Result<void> CredentialManager::set(const std::string& key, const std::string& value) {
    return set_impl(key, value);
}

Result<void> CredentialManager::remove(const std::string& key) {
    return remove_impl(key);
}

Result<std::string> resolve_api_key() {
    const char* env = std::getenv(API_KEY_ENV);
    if (env && *env) {
        return Result<std::string>::Ok(env);
    }

    auto stored = CredentialManager::instance().get(API_KEY_CREDENTIAL);
    if (stored.is_err() || stored.value.empty()) {
        return Result<std::string>::Err(
            std::string("No API key found. Run 'docsync setup' or set ") + API_KEY_ENV + ".");
    }
    return stored;
}
