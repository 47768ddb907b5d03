#pragma once

#include "output/outputter.hpp"

#include <optional>
#include <string>
#include <vector>

// In-memory Outputter for tests of code that delivers text. Records what it
// was asked to do instead of spawning anything. A call that fails because of
// an injected error is not recorded.
class MockOutputter : public Outputter {
public:
    OutputResult copy_to_clipboard(const std::string& text) override;
    OutputResult type_to_active_window(const std::string& text) override;
    ToolNames tool_names() const override;

    void set_clipboard_error(OutputError err) { clipboard_error_ = std::move(err); }
    void set_type_error(OutputError err) { type_error_ = std::move(err); }
    void clear_errors();

    // Canned failures.
    void simulate_clipboard_unavailable();
    void simulate_permission_denied();
    void simulate_timeout();

    int clipboard_call_count() const { return static_cast<int>(clipboard_history_.size()); }
    int type_call_count() const { return static_cast<int>(type_history_.size()); }
    bool was_clipboard_called() const { return !clipboard_history_.empty(); }
    bool was_type_called() const { return !type_history_.empty(); }

    const std::vector<std::string>& clipboard_history() const { return clipboard_history_; }
    const std::vector<std::string>& type_history() const { return type_history_; }

    // Empty if there was no call.
    std::string last_clipboard_text() const;
    std::string last_typed_text() const;

    // True if any recorded call's text contains `needle`.
    bool clipboard_contains(const std::string& needle) const;
    bool type_contains(const std::string& needle) const;

    void reset();

private:
    std::optional<OutputError> clipboard_error_;
    std::optional<OutputError> type_error_;
    std::vector<std::string> clipboard_history_;
    std::vector<std::string> type_history_;
};
