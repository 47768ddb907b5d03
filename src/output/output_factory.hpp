#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "output/outputter.hpp"
#include "output/tool_selector.hpp"
#include "security/command_policy.hpp"

#include <expected>
#include <memory>

namespace output_mode {
inline constexpr const char* clipboard = "clipboard";
inline constexpr const char* active_window = "active_window";
inline constexpr const char* combined = "combined";

bool is_valid(const std::string& mode);
} // namespace output_mode

// Build the outputter for config.default_mode ("clipboard", "active_window"
// or "combined"; anything else means clipboard). Tools set to "auto" are
// resolved by `selector`. A resolved tool that the policy rejects fails with
// ToolNotAllowed before any PATH lookup. The policy must outlive the result.
std::expected<std::unique_ptr<Outputter>, OutputError>
make_outputter(const Config::Output& config, platform::EnvironmentClass env,
               const SecurityPolicy& policy, const Logger& logger,
               const ToolSelector& selector = ToolSelector{});

// Clipboard-only outputter for when the configured one cannot be built:
// wl-copy on Wayland if installed, otherwise xsel.
std::expected<std::unique_ptr<Outputter>, OutputError>
make_fallback_clipboard_outputter(platform::EnvironmentClass env,
                                  const SecurityPolicy& policy, const Logger& logger);
