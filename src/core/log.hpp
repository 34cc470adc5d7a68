#pragma once

#include <string>

// Debug log. Disabled until enable_zt_log() is called (the --debug flag);
// while disabled zt_log() is a no-op. An empty path disables it again.
void enable_zt_log(const std::string& path);
bool zt_log_enabled();
const std::string& zt_log_path();

// Append "[YYYY-MM-DDTHH:MM:SS] msg" to the debug log.
void zt_log(const std::string& msg);
