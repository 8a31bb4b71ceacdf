#pragma once

#include <string>
#include <cstdint>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int64_t safe_stoll(const std::string& s, int64_t fallback = 0);

// Directory part of a remote POSIX path ("/a/b/c" -> "/a/b", "c" -> ".").
std::string remote_dirname(const std::string& path);

// Remove every newline (stat output is one value per line).
inline std::string strip_newlines(std::string s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '\n') out += c;
    }
    return out;
}
