#pragma once

#include "output/output_error.hpp"
#include "platform/environment.hpp"

#include <chrono>
#include <string>

struct ToolNames {
    std::string clipboard;
    std::string type;

    bool operator==(const ToolNames&) const = default;
};

class Outputter {
public:
    virtual ~Outputter() = default;
    virtual OutputResult copy_to_clipboard(const std::string& text) = 0;
    virtual OutputResult type_to_active_window(const std::string& text) = 0;

    // For diagnostics only. The slot an outputter does not serve is empty.
    virtual ToolNames tool_names() const = 0;
};

struct OutputOptions {
    platform::EnvironmentClass environment = platform::detect_environment();
    std::chrono::milliseconds timeout{0};
};
