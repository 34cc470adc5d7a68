#include "log.hpp"
#include "utils.hpp"
#include <fstream>

static std::string& log_path_storage() {
    static std::string path;
    return path;
}

void enable_zt_log(const std::string& path) {
    log_path_storage() = path;
}

bool zt_log_enabled() {
    return !log_path_storage().empty();
}

const std::string& zt_log_path() {
    return log_path_storage();
}

void zt_log(const std::string& msg) {
    if (!zt_log_enabled()) return;

    std::ofstream out(zt_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << now_iso() << "] " << msg << "\n";
}
