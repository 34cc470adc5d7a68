#include "credentials.hpp"
#include "permissions.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <unistd.h>
#include <sstream>
#include <fmt/format.h>

namespace fs = std::filesystem;

// zuliprc layout (INI):
//   [api]
//   email=<login id>
//   key=<api key>
//   site=<server url>
//   [zterm]
//   theme=..., autohide=..., footlinks=..., color-depth=..., themes-file=...

Result<IniSections> parse_ini(const std::string& text) {
    IniSections sections;
    std::string current;
    bool in_section = false;

    std::istringstream in(text);
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[') {
            if (line.back() != ']' || line.size() < 3) {
                return Result<IniSections>::Err(ErrorKind::Malformed,
                    fmt::format("line {}: bad section header '{}'", lineno, line));
            }
            current = line.substr(1, line.size() - 2);
            trim(current);
            sections[current];
            in_section = true;
            continue;
        }

        auto sep = line.find_first_of("=:");
        if (sep == std::string::npos || sep == 0) {
            return Result<IniSections>::Err(ErrorKind::Malformed,
                fmt::format("line {}: expected key=value, got '{}'", lineno, line));
        }
        if (!in_section) {
            return Result<IniSections>::Err(ErrorKind::Malformed,
                fmt::format("line {}: key outside of any section", lineno));
        }

        std::string key = line.substr(0, sep);
        std::string value = line.substr(sep + 1);
        trim(key);
        trim(value);
        sections[current][key] = value;
    }

    return Result<IniSections>::Ok(sections);
}

Result<StoredConfig> CredentialStore::load(const fs::path& path) {
    auto perms = check_permissions(path);
    if (perms.is_err()) {
        return Result<StoredConfig>::Err(perms.kind, perms.error);
    }

    if (!perms.value.ok) {
        // Never read a file others could have read or altered.
        StoredConfig rejected;
        rejected.insecure_mode = perms.value.current_mode;
        zt_log(fmt::format("zuliprc {} rejected, mode {}", path.string(),
                           perms.value.current_mode));
        return Result<StoredConfig>{false, rejected,
            fmt::format("{} has permissions {}", path.string(), perms.value.current_mode),
            ErrorKind::InsecurePermissions};
    }

    std::ifstream f(path);
    if (!f) {
        return Result<StoredConfig>::Err(ErrorKind::Malformed,
            fmt::format("{} could not be opened", path.string()));
    }
    std::stringstream buf;
    buf << f.rdbuf();

    auto parsed = parse_ini(buf.str());
    if (parsed.is_err()) {
        return Result<StoredConfig>::Err(ErrorKind::Malformed, parsed.error);
    }

    auto api = parsed.value.find("api");
    if (api == parsed.value.end()) {
        return Result<StoredConfig>::Err(ErrorKind::Malformed, "missing [api] section");
    }

    StoredConfig config;
    auto field = [&](const char* key) {
        auto it = api->second.find(key);
        return it == api->second.end() ? std::string() : it->second;
    };
    config.credentials.login_id = field("email");
    config.credentials.api_key = field("key");
    config.credentials.server_url = field("site");

    auto zterm = parsed.value.find("zterm");
    if (zterm != parsed.value.end()) {
        config.zterm = zterm->second;
    }

    zt_log(fmt::format("Loaded zuliprc {} (site='{}')", path.string(),
                       config.credentials.server_url));
    return Result<StoredConfig>::Ok(config);
}

std::string CredentialStore::render(const CredentialRecord& record) {
    return fmt::format("[api]\nemail={}\nkey={}\nsite={}",
                       record.login_id, record.api_key, record.server_url);
}

std::string create_failure_message(ErrorKind kind, const fs::path& path) {
    if (kind == ErrorKind::AlreadyExists) {
        return fmt::format("zuliprc already exists at {}", path.string());
    }
    return fmt::format("{}: zuliprc could not be created at {}",
                       error_kind_name(kind), path.string());
}

Result<void> CredentialStore::create(const fs::path& path, const CredentialRecord& record) {
    auto created = secure_create(path);
    if (created.is_err()) {
        zt_log(fmt::format("secure_create failed: {}", created.error));
        return Result<void>::Err(created.kind, create_failure_message(created.kind, path));
    }

    FileHandle file = std::move(created.value);
    auto written = file.write_all(render(record));
    if (written.is_ok()) {
        written = file.close();
    }
    if (written.is_err()) {
        zt_log(fmt::format("writing {} failed: {}", path.string(), written.error));
        // Never leave a partial zuliprc behind
        file = FileHandle();
        if (::unlink(path.c_str()) != 0) {
            zt_log(fmt::format("could not remove {}: {}", path.string(), std::strerror(errno)));
        }
        return Result<void>::Err(ErrorKind::IoError,
                                 create_failure_message(ErrorKind::IoError, path));
    }

    return Result<void>::Ok();
}

fs::path CredentialStore::default_path() {
    return platform::home_dir() / ZULIPRC_FILENAME;
}
