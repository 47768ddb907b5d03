#pragma once

#include <string>
#include <string_view>

class SecurityPolicy;

namespace platform {

enum class EnvironmentClass {
    X11,
    Wayland,
    Unknown,
};

std::string_view to_string(EnvironmentClass env);

// WAYLAND_DISPLAY wins over DISPLAY: XWayland sessions export both.
EnvironmentClass detect_environment();

// XDG_CURRENT_DESKTOP, then DESKTOP_SESSION, else "Unknown".
std::string detect_desktop_environment();

bool is_gnome_desktop(std::string_view desktop);
bool is_gnome_with_wayland();

// Whether a StatusNotifierWatcher owns its name on the session bus. Only a
// hint for the tray UI: any failure to ask (no bus, no dbus-send, dbus-send
// not allowed by the policy) reads as false.
bool has_tray_watcher(const SecurityPolicy& policy);

} // namespace platform
