#include "output/tool_selector.hpp"

#include "platform/executable.hpp"

#include <array>
#include <utility>

using platform::EnvironmentClass;

namespace {

constexpr std::string_view kAuto = "auto";

constexpr std::array<std::pair<EnvironmentClass, std::string_view>, 3> kClipboardTools = {{
    {EnvironmentClass::Wayland, "wl-copy"},
    {EnvironmentClass::X11, "xsel"},
    {EnvironmentClass::Unknown, "xsel"},
}};

// xdotool is the last resort on Wayland: it only reaches XWayland clients.
const std::vector<TypeToolChain>& type_tool_table() {
    static const std::vector<TypeToolChain> table = {
        {EnvironmentClass::X11, false, {}, "xdotool"},
        // GNOME's compositor does not offer the virtual-keyboard protocol wtype needs.
        {EnvironmentClass::Wayland, true, {"ydotool", "wtype"}, "xdotool"},
        {EnvironmentClass::Wayland, false, {"wtype", "ydotool"}, "xdotool"},
        {EnvironmentClass::Unknown, false, {"xdotool", "wtype", "ydotool"}, "xdotool"},
    };
    return table;
}

} // namespace

ToolSelector::ToolSelector(Probe probe)
    : probe_(probe ? std::move(probe) : Probe(platform::executable_exists)) {}

std::string ToolSelector::select_clipboard_tool(EnvironmentClass env, const Config::Output& config) const {
    if (config.clipboard_tool != kAuto) return config.clipboard_tool;

    for (const auto& [e, tool] : kClipboardTools) {
        if (e == env) return std::string(tool);
    }
    return "xsel";
}

std::string ToolSelector::select_type_tool(EnvironmentClass env, const Config::Output& config) const {
    return select_type_tool(env, platform::is_gnome_desktop(platform::detect_desktop_environment()), config);
}

std::string ToolSelector::select_type_tool(EnvironmentClass env, bool gnome, const Config::Output& config) const {
    if (config.type_tool != kAuto) return config.type_tool;

    const auto& chain = type_tool_chain(env, gnome);
    for (const auto& tool : chain.candidates) {
        if (probe_(tool)) return tool;
    }
    return chain.fallback;
}

const TypeToolChain& ToolSelector::type_tool_chain(EnvironmentClass env, bool gnome) {
    // The desktop only matters on Wayland.
    if (env != EnvironmentClass::Wayland) gnome = false;

    for (const auto& chain : type_tool_table()) {
        if (chain.environment == env && chain.gnome == gnome) return chain;
    }
    return type_tool_table().back();
}
