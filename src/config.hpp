#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Output {
        std::string default_mode = "clipboard"; // "clipboard", "active_window" or "combined"
        std::string clipboard_tool = "auto";    // "auto" or an executable name
        std::string type_tool = "auto";
        uint32_t timeout_ms = 0;                // 0 waits for the tool indefinitely
    } output;

    struct Security {
        std::vector<std::string> allowed_commands = {
            "xsel", "wl-copy", "xdotool", "wtype", "ydotool", "dbus-send",
        };
    } security;

    static Config load(const std::string& path);
    static Config load_default();
};
