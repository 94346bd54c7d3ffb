#pragma once

#include <string>
#include <filesystem>

enum class LogLevel { Info, Warn, Error };

// Route log lines to `path` (created with its parent dirs). With `mirror_stderr`
// every line is also written to stderr. Until called, lines go to
// <tmp>/docsync_debug.log.
void log_init(const std::filesystem::path& path, bool mirror_stderr = false);

// Fresh per-run file name under `dir`: docsync_YYYYMMDD_HHMMSS.log
std::filesystem::path new_run_log_path(const std::filesystem::path& dir);

std::filesystem::path log_path();

// Name shown in log lines emitted from the calling thread (e.g. "worker-3").
void set_log_thread_name(const std::string& name);

void docsync_log(LogLevel level, const std::string& msg);

inline void docsync_log(const std::string& msg) { docsync_log(LogLevel::Info, msg); }
inline void docsync_warn(const std::string& msg) { docsync_log(LogLevel::Warn, msg); }
inline void docsync_error(const std::string& msg) { docsync_log(LogLevel::Error, msg); }
