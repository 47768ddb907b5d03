#include "platform/environment.hpp"

#include "platform/executable.hpp"
#include "platform/subprocess.hpp"
#include "security/command_policy.hpp"

#include <array>
#include <chrono>
#include <cstdlib>

namespace platform {

namespace {

bool env_set(const char* name) {
    const char* value = std::getenv(name);
    return value && *value;
}

constexpr std::array<std::string_view, 2> kTrayWatcherNames = {
    "org.kde.StatusNotifierWatcher",
    "org.freedesktop.StatusNotifierWatcher",
};

} // namespace

std::string_view to_string(EnvironmentClass env) {
    switch (env) {
        case EnvironmentClass::X11: return "X11";
        case EnvironmentClass::Wayland: return "Wayland";
        case EnvironmentClass::Unknown: return "Unknown";
    }
    return "Unknown";
}

EnvironmentClass detect_environment() {
    if (env_set("WAYLAND_DISPLAY")) return EnvironmentClass::Wayland;
    if (env_set("DISPLAY")) return EnvironmentClass::X11;
    return EnvironmentClass::Unknown;
}

std::string detect_desktop_environment() {
    if (const char* de = std::getenv("XDG_CURRENT_DESKTOP"); de && *de) return de;
    if (const char* de = std::getenv("DESKTOP_SESSION"); de && *de) return de;
    return "Unknown";
}

bool is_gnome_desktop(std::string_view desktop) {
    return desktop == "GNOME" || desktop == "ubuntu:GNOME";
}

bool is_gnome_with_wayland() {
    return is_gnome_desktop(detect_desktop_environment()) &&
           detect_environment() == EnvironmentClass::Wayland;
}

bool has_tray_watcher(const SecurityPolicy& policy) {
    if (!policy.is_command_allowed("dbus-send") || !executable_exists("dbus-send")) {
        return false;
    }

    for (auto name : kTrayWatcherNames) {
        std::vector<std::string> argv = {
            "dbus-send", "--session", "--print-reply", "--reply-timeout=1000",
            "--dest=org.freedesktop.DBus", "/org/freedesktop/DBus",
            "org.freedesktop.DBus.NameHasOwner", "string:" + std::string(name),
        };
        auto res = run_process(SecurityPolicy::sanitize_arguments(argv),
                               {.timeout = std::chrono::seconds(2)});
        if (!res || !res->ok()) continue;

        // Reply body looks like: "method return ... \n   boolean true"
        if (res->output.find("boolean true") != std::string::npos) return true;
    }
    return false;
}

} // namespace platform
