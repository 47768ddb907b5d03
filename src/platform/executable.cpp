#include "platform/executable.hpp"

#include <cstdlib>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

bool is_executable_file(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

} // namespace

std::string find_executable(const std::string& name) {
    if (name.empty()) return {};

    if (name.find('/') != std::string::npos) {
        return is_executable_file(name) ? name : std::string{};
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return {};

    std::string_view path(path_env);
    while (true) {
        auto sep = path.find(':');
        auto dir = path.substr(0, sep);
        // An empty entry means the current directory.
        std::string candidate = dir.empty() ? name : std::string(dir) + "/" + name;
        if (is_executable_file(candidate)) return candidate;

        if (sep == std::string_view::npos) break;
        path.remove_prefix(sep + 1);
    }
    return {};
}

} // namespace platform
