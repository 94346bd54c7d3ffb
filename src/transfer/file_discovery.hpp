#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct DiscoveredFiles {
    std::vector<fs::path> all;       // every regular file seen
    std::vector<fs::path> allowed;   // extension on the allow list
};

// Collect regular files under `folder`, sorted by path. Extensions compare
// case-insensitively and may be given with or without the leading dot.
Result<DiscoveredFiles> discover_files(const fs::path& folder,
                                       const std::vector<std::string>& allowed_extensions,
                                       bool recursive = false);
