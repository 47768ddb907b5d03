#include "output/clipboard_output.hpp"

#include "output/tool_invocation.hpp"
#include "platform/executable.hpp"

#include <optional>
#include <vector>

namespace {

// Both tools read the text from stdin.
std::optional<std::vector<std::string>> clipboard_arguments(const std::string& tool) {
    if (tool == "xsel") return std::vector<std::string>{"--clipboard", "--input"};
    if (tool == "wl-copy") return std::vector<std::string>{};
    return std::nullopt;
}

} // namespace

std::expected<std::unique_ptr<ClipboardOutputter>, OutputError>
ClipboardOutputter::create(std::string tool, const SecurityPolicy& policy, OutputOptions options) {
    if (!platform::executable_exists(tool)) {
        return output_error(OutputErrorKind::ToolNotFound, "clipboard tool not found: " + tool);
    }
    return std::make_unique<ClipboardOutputter>(Key{}, std::move(tool), policy, options);
}

ClipboardOutputter::ClipboardOutputter(Key, std::string tool, const SecurityPolicy& policy,
                                       OutputOptions options)
    : tool_(std::move(tool)), policy_(policy), options_(options) {}

OutputResult ClipboardOutputter::copy_to_clipboard(const std::string& text) {
    // Checked on every call; the policy may have changed since construction.
    if (!policy_.is_command_allowed(tool_)) {
        return output_error(OutputErrorKind::ToolNotAllowed, "clipboard tool not allowed: " + tool_);
    }

    auto args = clipboard_arguments(tool_);
    if (!args) {
        return output_error(OutputErrorKind::UnsupportedTool, "unsupported clipboard tool: " + tool_);
    }

    // xsel and wl-copy fork a selection owner that keeps inherited fds open
    // until the clipboard changes hands, so output is not captured.
    return run_tool({
        .tool = tool_,
        .args = std::move(*args),
        .input = text,
        .capture_output = false,
        .timeout = options_.timeout,
    }, "failed to copy to clipboard");
}

OutputResult ClipboardOutputter::type_to_active_window(const std::string& /*text*/) {
    return output_error(OutputErrorKind::UnsupportedOperation,
                        "typing to active window not supported by clipboard outputter");
}

ToolNames ClipboardOutputter::tool_names() const {
    return {tool_, ""};
}
