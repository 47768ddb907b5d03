#include "output/output_factory.hpp"

#include "output/clipboard_output.hpp"
#include "output/combined_output.hpp"
#include "output/type_output.hpp"
#include "platform/executable.hpp"

#include <chrono>
#include <format>

namespace output_mode {

bool is_valid(const std::string& mode) {
    return mode == clipboard || mode == active_window || mode == combined;
}

} // namespace output_mode

std::expected<std::unique_ptr<Outputter>, OutputError>
make_outputter(const Config::Output& config, platform::EnvironmentClass env,
               const SecurityPolicy& policy, const Logger& logger,
               const ToolSelector& selector) {
    OutputOptions options{
        .environment = env,
        .timeout = std::chrono::milliseconds(config.timeout_ms),
    };

    const std::string& mode = config.default_mode;
    bool wants_clipboard = mode != output_mode::active_window;
    bool wants_typing = mode == output_mode::active_window || mode == output_mode::combined;

    if (!output_mode::is_valid(mode)) {
        logger.warn(std::format("unknown output mode '{}', using clipboard", mode));
    }

    std::string clipboard_tool;
    std::string type_tool;

    if (wants_clipboard) {
        clipboard_tool = selector.select_clipboard_tool(env, config);
        if (!policy.is_command_allowed(clipboard_tool)) {
            return output_error(OutputErrorKind::ToolNotAllowed, "clipboard tool not allowed: " + clipboard_tool);
        }
    }
    if (wants_typing) {
        type_tool = selector.select_type_tool(env, config);
        if (!policy.is_command_allowed(type_tool)) {
            return output_error(OutputErrorKind::ToolNotAllowed, "type tool not allowed: " + type_tool);
        }
    }

    logger.log(std::format("output: mode={} env={} clipboard={} type={}",
                           mode, platform::to_string(env),
                           clipboard_tool.empty() ? "-" : clipboard_tool,
                           type_tool.empty() ? "-" : type_tool));

    if (wants_clipboard && wants_typing) {
        return CombinedOutputter::create(clipboard_tool, type_tool, policy, options);
    }
    if (wants_typing) {
        return TypeOutputter::create(type_tool, policy, options);
    }
    return ClipboardOutputter::create(clipboard_tool, policy, options);
}

std::expected<std::unique_ptr<Outputter>, OutputError>
make_fallback_clipboard_outputter(platform::EnvironmentClass env,
                                  const SecurityPolicy& policy, const Logger& logger) {
    std::vector<std::string> candidates;
    if (env == platform::EnvironmentClass::Wayland) candidates.push_back("wl-copy");
    candidates.push_back("xsel");

    for (const auto& tool : candidates) {
        if (!platform::executable_exists(tool) || !policy.is_command_allowed(tool)) continue;

        auto out = ClipboardOutputter::create(tool, policy, {.environment = env});
        if (out) {
            logger.log("falling back to clipboard output using " + tool);
            return std::move(*out);
        }
    }
    return output_error(OutputErrorKind::ToolNotFound, "no clipboard tool available for fallback");
}
