#include "time_utils.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <cctype>
#include <climits>

// SLURM clock forms: "HH:MM:SS", "MM:SS", "D-HH:MM:SS", "D-HH:MM"
static long parse_clock_secs(const std::string& s) {
    long days = 0;
    std::string clock = s;
    auto dash = s.find('-');
    if (dash != std::string::npos) {
        days = safe_stol(s.substr(0, dash), -1);
        if (days < 0) return 0;
        clock = s.substr(dash + 1);
    }

    auto fields = split(clock, ':');
    if (fields.size() < 2 || fields.size() > 3) return 0;

    long total = 0;
    for (const auto& f : fields) {
        long v = safe_stol(f, -1);
        if (f.empty() || v < 0) return 0;
        if (total > (LONG_MAX - v) / 60) return 0;
        total = total * 60 + v;
    }
    if (fields.size() == 2 && dash != std::string::npos) {
        if (total > LONG_MAX / 60) return 0;
        total *= 60;
    }
    if (days > (LONG_MAX - total) / 86400) return 0;
    return days * 86400 + total;
}

long parse_duration_secs(const std::string& duration) {
    std::string s = duration;
    trim(s);
    if (s.empty()) return 0;

    if (s.find(':') != std::string::npos) {
        return parse_clock_secs(s);
    }

    long multiplier = 1;
    char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(s.back())));
    if (std::isalpha(static_cast<unsigned char>(unit))) {
        switch (unit) {
            case 's': multiplier = 1; break;
            case 'm': multiplier = 60; break;
            case 'h': multiplier = 3600; break;
            case 'd': multiplier = 86400; break;
            default: return 0;
        }
        s.pop_back();
    }

    long value = safe_stol(s, -1);
    if (value < 0 || value > LONG_MAX / multiplier) return 0;
    return value * multiplier;
}

std::string format_timeout(long seconds) {
    return fmt::format("{}s", seconds);
}

std::string normalize_timeout(const std::string& duration) {
    long secs = parse_duration_secs(duration);
    if (secs <= 0) {
        throw ConfigurationError(fmt::format("Invalid timeout: '{}'", duration));
    }
    return format_timeout(secs);
}
