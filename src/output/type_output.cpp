#include "output/type_output.hpp"

#include "output/tool_invocation.hpp"
#include "platform/executable.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <vector>

namespace {

// "--" ends option parsing, so dictated text like "-5 degrees" is typed
// rather than read as a flag.
std::optional<std::vector<std::string>> type_arguments(const std::string& tool, const std::string& text) {
    if (tool == "xdotool") return std::vector<std::string>{"type", "--clearmodifiers", "--", text};
    if (tool == "wtype") return std::vector<std::string>{text};
    if (tool == "ydotool") return std::vector<std::string>{"type", "--", text};
    return std::nullopt;
}

} // namespace

bool contains_non_ascii(const std::string& text) {
    return std::ranges::any_of(text, [](char c) { return static_cast<unsigned char>(c) > 0x7F; });
}

std::expected<std::unique_ptr<TypeOutputter>, OutputError>
TypeOutputter::create(std::string tool, const SecurityPolicy& policy, OutputOptions options) {
    if (!platform::executable_exists(tool)) {
        return output_error(OutputErrorKind::ToolNotFound, "type tool not found: " + tool);
    }
    return std::make_unique<TypeOutputter>(Key{}, std::move(tool), policy, options);
}

TypeOutputter::TypeOutputter(Key, std::string tool, const SecurityPolicy& policy, OutputOptions options)
    : tool_(std::move(tool)), policy_(policy), options_(options) {}

OutputResult TypeOutputter::type_to_active_window(const std::string& text) {
    if (!policy_.is_command_allowed(tool_)) {
        return output_error(OutputErrorKind::ToolNotAllowed, "typing tool not allowed: " + tool_);
    }

    auto res = type_with(tool_, text);
    if (res || tool_ != "wtype") return res;

    // wtype needs the virtual-keyboard protocol, which some compositors lack.
    if (!policy_.is_command_allowed("ydotool") || !platform::executable_exists("ydotool")) {
        return res;
    }

    auto fallback = type_with("ydotool", text);
    if (fallback) return {};

    return output_error(OutputErrorKind::ExecutionFailed,
                        std::format("wtype failed: {}; ydotool fallback failed: {}",
                                    res.error().message, fallback.error().message));
}

OutputResult TypeOutputter::type_with(const std::string& tool, const std::string& text) const {
    if (options_.environment == platform::EnvironmentClass::Wayland &&
        tool == "ydotool" && contains_non_ascii(text)) {
        return output_error(OutputErrorKind::EncodingUnsupported,
                            "ydotool on Wayland doesn't support non-ASCII characters, use clipboard fallback");
    }

    auto args = type_arguments(tool, text);
    if (!args) {
        return output_error(OutputErrorKind::UnsupportedTool, "unsupported typing tool: " + tool);
    }

    return run_tool({
        .tool = tool,
        .args = std::move(*args),
        .timeout = options_.timeout,
    }, "failed to type text with " + tool);
}

OutputResult TypeOutputter::copy_to_clipboard(const std::string& /*text*/) {
    return output_error(OutputErrorKind::UnsupportedOperation,
                        "copying to clipboard not supported by type outputter");
}

ToolNames TypeOutputter::tool_names() const {
    return {"", tool_};
}
