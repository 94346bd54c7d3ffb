#include "log.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

static std::mutex g_log_mutex;
static fs::path g_log_path;
static bool g_mirror_stderr = false;
static thread_local std::string t_thread_name;

fs::path log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_path.empty()) {
        g_log_path = fs::temp_directory_path() / "docsync_debug.log";
    }
    return g_log_path;
}

void log_init(const fs::path& path, bool mirror_stderr) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = path;
    g_mirror_stderr = mirror_stderr;
}

fs::path new_run_log_path(const fs::path& dir) {
    return dir / ("docsync_" + now_compact() + ".log");
}

void set_log_thread_name(const std::string& name) {
    t_thread_name = name;
}

static const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        default:              return "INFO ";
    }
}

static std::string thread_tag() {
    if (!t_thread_name.empty()) return t_thread_name;
    std::ostringstream oss;
    oss << "T" << std::this_thread::get_id();
    return oss.str();
}

void docsync_log(LogLevel level, const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::string line = fmt::format("[{}] {} [{}] {}", ts, level_tag(level), thread_tag(), msg);

    // One writer at a time so worker lines never interleave
    std::string path = log_path().string();
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ofstream out(path, std::ios::app);
    if (out) {
        out << line << "\n";
    }
    if (g_mirror_stderr) {
        std::cerr << line << "\n";
    }
}
