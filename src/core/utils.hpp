#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

// Compact local timestamp for file names: YYYYMMDD_HHMMSS
std::string now_compact();

// Standard (padded) base64 of arbitrary bytes.
std::string base64_encode(const std::string& input);

// Percent-encode a query parameter value (RFC 3986 unreserved set passes through).
std::string url_encode(const std::string& value);

// Read a whole file as bytes.
Result<std::string> read_file_bytes(const std::filesystem::path& path);

// First `max_len` chars of `s`, with "..." appended when cut. For log lines.
std::string clip(const std::string& s, size_t max_len = 200);

// Lowercase ASCII copy
std::string to_lower(std::string s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
