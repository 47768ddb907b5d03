#include "output/mock_output.hpp"

#include <algorithm>

namespace {

bool any_contains(const std::vector<std::string>& history, const std::string& needle) {
    return std::ranges::any_of(history, [&](const std::string& call) {
        return call.find(needle) != std::string::npos;
    });
}

} // namespace

OutputResult MockOutputter::copy_to_clipboard(const std::string& text) {
    if (clipboard_error_) return std::unexpected(*clipboard_error_);
    clipboard_history_.push_back(text);
    return {};
}

OutputResult MockOutputter::type_to_active_window(const std::string& text) {
    if (type_error_) return std::unexpected(*type_error_);
    type_history_.push_back(text);
    return {};
}

ToolNames MockOutputter::tool_names() const {
    return {"mock-clipboard", "mock-type"};
}

void MockOutputter::clear_errors() {
    clipboard_error_.reset();
    type_error_.reset();
}

void MockOutputter::simulate_clipboard_unavailable() {
    set_clipboard_error({OutputErrorKind::ExecutionFailed, "clipboard service unavailable"});
}

void MockOutputter::simulate_permission_denied() {
    set_type_error({OutputErrorKind::ExecutionFailed, "permission denied: cannot access active window"});
}

void MockOutputter::simulate_timeout() {
    set_clipboard_error({OutputErrorKind::Timeout, "operation timed out"});
    set_type_error({OutputErrorKind::Timeout, "operation timed out"});
}

std::string MockOutputter::last_clipboard_text() const {
    return clipboard_history_.empty() ? std::string{} : clipboard_history_.back();
}

std::string MockOutputter::last_typed_text() const {
    return type_history_.empty() ? std::string{} : type_history_.back();
}

bool MockOutputter::clipboard_contains(const std::string& needle) const {
    return any_contains(clipboard_history_, needle);
}

bool MockOutputter::type_contains(const std::string& needle) const {
    return any_contains(type_history_, needle);
}

void MockOutputter::reset() {
    clear_errors();
    clipboard_history_.clear();
    type_history_.clear();
}
