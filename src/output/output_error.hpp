#pragma once

#include <expected>
#include <string>
#include <string_view>

enum class OutputErrorKind {
    ToolNotFound,         // tool did not resolve on $PATH when the outputter was built
    ToolNotAllowed,       // rejected by the security allowlist
    UnsupportedTool,      // no argument template for this tool
    UnsupportedOperation, // this outputter does not offer the operation
    ExecutionFailed,      // spawn error or non-zero exit
    EncodingUnsupported,  // text the selected tool is known to mangle
    Timeout,              // tool killed after the configured timeout
};

struct OutputError {
    OutputErrorKind kind;
    std::string message;
};

using OutputResult = std::expected<void, OutputError>;

std::string_view to_string(OutputErrorKind kind);

inline std::unexpected<OutputError> output_error(OutputErrorKind kind, std::string message) {
    return std::unexpected(OutputError{kind, std::move(message)});
}
