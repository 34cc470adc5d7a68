#pragma once

#include <string>
#include <map>
#include <filesystem>
#include "types.hpp"

// Parsed zuliprc: the [api] identity plus the [zterm] settings section,
// which is the config-file layer for presentation settings.
struct StoredConfig {
    CredentialRecord credentials;
    std::map<std::string, std::string> zterm;
    std::string insecure_mode;  // set only alongside InsecurePermissions
};

class CredentialStore {
public:
    // Read the zuliprc at `path`.
    //   NotFound             the file does not exist
    //   InsecurePermissions  group/other bits set; contents are not read and
    //                        value.insecure_mode holds the current mode string
    //   Malformed            unparsable, or no [api] section
    static Result<StoredConfig> load(const std::filesystem::path& path);

    // Write a fresh zuliprc. Never overwrites: an existing file is
    // AlreadyExists. On any other failure no file is left behind.
    // The error text is ready to show the user.
    static Result<void> create(const std::filesystem::path& path, const CredentialRecord& record);

    // "[api]\nemail=..\nkey=..\nsite=.." with no trailing newline
    static std::string render(const CredentialRecord& record);

    // Default location: $HOME/zuliprc
    static std::filesystem::path default_path();
};

// User-facing text for a failed create():
//   AlreadyExists  "zuliprc already exists at {path}"
//   otherwise      "{Kind}: zuliprc could not be created at {path}"
std::string create_failure_message(ErrorKind kind, const std::filesystem::path& path);

// INI-style parse shared by load(); exposed for tests.
// Section names map to their key/value pairs.
using IniSections = std::map<std::string, std::map<std::string, std::string>>;
Result<IniSections> parse_ini(const std::string& text);
