#include "output/tool_invocation.hpp"

#include "platform/subprocess.hpp"
#include "security/command_policy.hpp"

#include <format>

namespace {

std::string trim_output(std::string out) {
    auto end = out.find_last_not_of(" \t\r\n");
    out.erase(end == std::string::npos ? 0 : end + 1);
    return out;
}

} // namespace

OutputResult run_tool(const ToolInvocation& inv, const std::string& what) {
    std::vector<std::string> argv;
    argv.reserve(inv.args.size() + 1);
    argv.push_back(inv.tool);
    for (auto& arg : SecurityPolicy::sanitize_arguments(inv.args)) {
        argv.push_back(std::move(arg));
    }

    auto res = platform::run_process(argv, {
        .input = inv.input,
        .capture_output = inv.capture_output,
        .timeout = inv.timeout,
    });

    if (!res) {
        return output_error(OutputErrorKind::ExecutionFailed, std::format("{}: {}", what, res.error()));
    }

    if (res->timed_out) {
        return output_error(OutputErrorKind::Timeout,
                            std::format("{}: {} timed out after {}ms", what, inv.tool, inv.timeout.count()));
    }

    if (res->exit_code != 0) {
        auto out = trim_output(std::move(res->output));
        if (out.empty()) {
            return output_error(OutputErrorKind::ExecutionFailed,
                                std::format("{}: {} exited with code {}", what, inv.tool, res->exit_code));
        }
        return output_error(OutputErrorKind::ExecutionFailed,
                            std::format("{}: {} exited with code {}, output: {}",
                                        what, inv.tool, res->exit_code, out));
    }

    return {};
}
