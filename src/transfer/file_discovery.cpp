#include "file_discovery.hpp"
#include <core/utils.hpp>
#include <algorithm>
#include <set>

static std::set<std::string> normalize_extensions(const std::vector<std::string>& exts) {
    std::set<std::string> out;
    for (const auto& e : exts) {
        std::string s = to_lower(e);
        trim(s);
        if (s.empty()) continue;
        if (s[0] != '.') s = "." + s;
        out.insert(s);
    }
    return out;
}

Result<DiscoveredFiles> discover_files(const fs::path& folder,
                                       const std::vector<std::string>& allowed_extensions,
                                       bool recursive) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        return Result<DiscoveredFiles>::Err("Not a directory: " + folder.string());
    }

    auto allowed = normalize_extensions(allowed_extensions);
    DiscoveredFiles found;

    auto visit = [&](const fs::directory_entry& entry) {
        std::error_code fec;
        if (!entry.is_regular_file(fec)) return;
        found.all.push_back(entry.path());
        if (allowed.count(to_lower(entry.path().extension().string()))) {
            found.allowed.push_back(entry.path());
        }
    };

    if (recursive) {
        fs::recursive_directory_iterator it(folder, fs::directory_options::skip_permission_denied, ec);
        if (ec) return Result<DiscoveredFiles>::Err("Cannot read " + folder.string() + ": " + ec.message());
        for (const auto& entry : it) visit(entry);
    } else {
        fs::directory_iterator it(folder, ec);
        if (ec) return Result<DiscoveredFiles>::Err("Cannot read " + folder.string() + ": " + ec.message());
        for (const auto& entry : it) visit(entry);
    }

    std::sort(found.all.begin(), found.all.end());
    std::sort(found.allowed.begin(), found.allowed.end());
    return Result<DiscoveredFiles>::Ok(std::move(found));
}
