#include "output/output_error.hpp"

std::string_view to_string(OutputErrorKind kind) {
    switch (kind) {
        case OutputErrorKind::ToolNotFound: return "tool not found";
        case OutputErrorKind::ToolNotAllowed: return "tool not allowed";
        case OutputErrorKind::UnsupportedTool: return "unsupported tool";
        case OutputErrorKind::UnsupportedOperation: return "unsupported operation";
        case OutputErrorKind::ExecutionFailed: return "execution failed";
        case OutputErrorKind::EncodingUnsupported: return "encoding unsupported";
        case OutputErrorKind::Timeout: return "timeout";
    }
    return "unknown";
}
