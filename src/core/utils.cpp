#include "utils.hpp"
#include "types.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <sys/stat.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "None";
        case ErrorKind::ParseError:           return "ParseError";
        case ErrorKind::NotFound:             return "NotFound";
        case ErrorKind::InsecurePermissions:  return "InsecurePermissions";
        case ErrorKind::AlreadyExists:        return "AlreadyExists";
        case ErrorKind::PermissionDenied:     return "PermissionDenied";
        case ErrorKind::PathNotFound:         return "PathNotFound";
        case ErrorKind::IoError:              return "IoError";
        case ErrorKind::Malformed:            return "Malformed";
        case ErrorKind::ConnectionFailure:    return "ConnectionFailure";
        case ErrorKind::AuthenticationFailed: return "AuthenticationFailed";
    }
    return "Unknown";
}

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string file_mode_string(mode_t mode) {
    std::string s(10, '-');

    if (S_ISDIR(mode))       s[0] = 'd';
    else if (S_ISLNK(mode))  s[0] = 'l';
    else if (S_ISCHR(mode))  s[0] = 'c';
    else if (S_ISBLK(mode))  s[0] = 'b';
    else if (S_ISFIFO(mode)) s[0] = 'p';
    else if (S_ISSOCK(mode)) s[0] = 's';

    if (mode & S_IRUSR) s[1] = 'r';
    if (mode & S_IWUSR) s[2] = 'w';
    if (mode & S_IRGRP) s[4] = 'r';
    if (mode & S_IWGRP) s[5] = 'w';
    if (mode & S_IROTH) s[7] = 'r';
    if (mode & S_IWOTH) s[8] = 'w';

    // Execute slots double as setuid/setgid/sticky markers
    if (mode & S_ISUID) s[3] = (mode & S_IXUSR) ? 's' : 'S';
    else if (mode & S_IXUSR) s[3] = 'x';
    if (mode & S_ISGID) s[6] = (mode & S_IXGRP) ? 's' : 'S';
    else if (mode & S_IXGRP) s[6] = 'x';
    if (mode & S_ISVTX) s[9] = (mode & S_IXOTH) ? 't' : 'T';
    else if (mode & S_IXOTH) s[9] = 'x';

    return s;
}

std::string normalize_server_url(std::string url) {
    trim(url);
    if (url.rfind("localhost", 0) == 0) {
        url = "http://" + url;
    } else if (url.rfind("http", 0) != 0) {
        url = "https://" + url;
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string expand_user(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}
