#pragma once

#include <string>
#include <sys/types.h>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Render st_mode the way `ls -l` does, e.g. "-rw-r--r--".
std::string file_mode_string(mode_t mode);

// Normalise a server URL typed by the user: bare "localhost..." gets http://,
// anything else without a scheme gets https://, trailing slashes are dropped.
std::string normalize_server_url(std::string url);

// Expand a leading "~" or "~/" to the home directory.
std::string expand_user(const std::string& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
