#pragma once

#include <string>

// Parse a duration into seconds. Accepts "90s", "15m", "24h", "7d", a bare
// number of seconds, "HH:MM:SS" and SLURM-style "D-HH:MM:SS".
// Returns 0 on parse failure or when the result does not fit in a long.
long parse_duration_secs(const std::string& duration);

// Format seconds as a pipelines duration string: 3600 -> "3600s".
std::string format_timeout(long seconds);

// parse_duration_secs + format_timeout. Throws ConfigurationError when the
// value does not parse or is not positive.
std::string normalize_timeout(const std::string& duration);
