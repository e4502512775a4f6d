#pragma once

#include <string>
#include <fstream>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>

inline std::string minsub_log_path() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_FILE).string();
    return path;
}

// Append a timestamped line to the debug log. Never throws.
inline void minsub_log(const std::string& msg) {
    std::ofstream out(minsub_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << now_clock() << "] " << msg << "\n";
}
