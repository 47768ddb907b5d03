#pragma once

#include "config.hpp"
#include "platform/environment.hpp"

#include <functional>
#include <string>
#include <vector>

// One row of the typing-tool priority table. Candidates are probed in order;
// the first available one wins, otherwise `fallback` is returned unprobed.
struct TypeToolChain {
    platform::EnvironmentClass environment;
    bool gnome;
    std::vector<std::string> candidates;
    std::string fallback;
};

// Resolves "auto" tool settings to concrete executable names. Probing is only
// a hint: a tool that resolves on $PATH may still fail at runtime.
class ToolSelector {
public:
    using Probe = std::function<bool(const std::string&)>;

    // The default probe searches $PATH.
    explicit ToolSelector(Probe probe = {});

    std::string select_clipboard_tool(platform::EnvironmentClass env, const Config::Output& config) const;

    // The GNOME branch is taken when the desktop environment reported by
    // platform::detect_desktop_environment() is GNOME and env is Wayland.
    std::string select_type_tool(platform::EnvironmentClass env, const Config::Output& config) const;
    std::string select_type_tool(platform::EnvironmentClass env, bool gnome, const Config::Output& config) const;

    static const TypeToolChain& type_tool_chain(platform::EnvironmentClass env, bool gnome);

private:
    Probe probe_;
};
