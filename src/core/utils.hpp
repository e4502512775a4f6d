#pragma once

#include <string>
#include <vector>

// Current local time as HH:MM:SS.mmm, used to prefix debug log lines.
std::string now_clock();

// Safe integer parse: returns fallback on failure (no exceptions).
long safe_stol(const std::string& s, long fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Split on every occurrence of delimiter. Empty fields are kept.
std::vector<std::string> split(const std::string& s, char delimiter);

// POSIX-style join: "/mnt/data" + "gs/b/x" -> "/mnt/data/gs/b/x".
// An absolute tail replaces the head.
std::string join_path(const std::string& head, const std::string& tail);
