#pragma once

#include <filesystem>

namespace platform {

// Per-user directory holding config.yaml, credentials and logs/.
// $DOCSYNC_HOME wins when set; otherwise
//   macOS    ~/Library/Application Support/docsync
//   Windows  %LOCALAPPDATA%\docsync
//   other    ~/.docsync
std::filesystem::path app_data_dir();

} // namespace platform
