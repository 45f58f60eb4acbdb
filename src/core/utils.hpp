#pragma once

#include <string>
#include <chrono>
#include <ctime>
#include <optional>

using SystemTime = std::chrono::system_clock::time_point;

// Format a time point as UTC ISO 8601 with a trailing Z (YYYY-MM-DDTHH:MM:SSZ).
std::string format_iso_utc(SystemTime t);

// Parse YYYY-MM-DDTHH:MM:SS[Z] as UTC. Returns nullopt on malformed input.
std::optional<SystemTime> parse_iso_utc(const std::string& iso);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

std::string to_lower(std::string s);
std::string to_upper(std::string s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Replace every character outside [A-Za-z0-9_-] with '_' (file-name safe).
std::string sanitize_key(const std::string& key);
