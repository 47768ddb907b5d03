#pragma once

#include <string>

namespace platform {

// Resolve an executable the way execvp() would: names containing a slash are
// checked as-is, anything else is searched for in $PATH.
// Returns the full path, or an empty string if nothing executable was found.
std::string find_executable(const std::string& name);

inline bool executable_exists(const std::string& name) {
    return !find_executable(name).empty();
}

} // namespace platform
