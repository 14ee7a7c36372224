#include "path_utils.h"
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>
#include <sys/utsname.h>

namespace fs = std::filesystem;

namespace taco {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

std::string resolve_path(const std::string& path, const std::string& base_dir) {
    std::string expanded = expand_path(path);
    if (expanded.empty() || expanded[0] == '/' || base_dir.empty()) {
        return expanded;
    }
    return (fs::path(base_dir) / expanded).lexically_normal().string();
}

std::string executable_dir() {
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len == -1) {
        return ".";
    }
    buf[len] = '\0';
    return fs::path(buf).parent_path().string();
}

uint64_t file_size_or_zero(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return 0;
    }
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

std::string keyword_platform_suffix() {
#if defined(__APPLE__)
    return "mac";
#else
    struct utsname info;
    if (uname(&info) == 0) {
        std::string machine = info.machine;
        if (machine.find("arm") != std::string::npos || machine.find("aarch64") != std::string::npos) {
            return "raspberry-pi";
        }
    }
    return "linux-x86_64";
#endif
}

} // namespace taco
