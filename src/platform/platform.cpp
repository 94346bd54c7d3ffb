#include "platform.hpp"
#include <core/constants.hpp>
#include <cstdlib>
#include <string>

namespace fs = std::filesystem;

namespace platform {

static fs::path env_path(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return {};
    return fs::path(v);
}

fs::path app_data_dir() {
    fs::path override_dir = env_path(APP_DIR_ENV);
    if (!override_dir.empty()) return override_dir;

#ifdef _WIN32
    fs::path local = env_path("LOCALAPPDATA");
    if (local.empty()) {
        fs::path profile = env_path("USERPROFILE");
        if (profile.empty()) return fs::temp_directory_path() / APP_NAME;
        local = profile / "AppData" / "Local";
    }
    return local / APP_NAME;
#else
    fs::path home = env_path("HOME");
    if (home.empty()) return fs::temp_directory_path() / APP_NAME;
#  ifdef __APPLE__
    return home / "Library" / "Application Support" / APP_NAME;
#  else
    return home / (std::string(".") + APP_NAME);
#  endif
#endif
}

} // namespace platform
