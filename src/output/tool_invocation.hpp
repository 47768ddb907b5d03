#pragma once

#include "output/output_error.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct ToolInvocation {
    std::string tool;
    std::vector<std::string> args;       // sanitized before spawning
    std::optional<std::string> input;    // piped to stdin when set
    bool capture_output = true;
    std::chrono::milliseconds timeout{0};
};

// Spawn the tool and map the outcome onto OutputError. `what` prefixes the
// error message, e.g. "failed to copy to clipboard".
OutputResult run_tool(const ToolInvocation& inv, const std::string& what);
