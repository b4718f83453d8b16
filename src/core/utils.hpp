#pragma once

#include <string>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Parse an octal permission string ("0700", "600"). Returns fallback on failure.
unsigned parse_mode(const std::string& s, unsigned fallback);

// A job ID is used as a path component and as a systemd instance name:
// non-empty, bounded, [A-Za-z0-9._-] only, and not "." or "..".
bool is_valid_job_id(const std::string& job_id);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
