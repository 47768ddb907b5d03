#pragma once

#include "output/outputter.hpp"
#include "security/command_policy.hpp"

#include <expected>
#include <memory>

// Copies text with xsel or wl-copy. Typing is not offered.
class ClipboardOutputter : public Outputter {
    struct Key {
        explicit Key() = default;
    };

public:
    // Fails with ToolNotFound if `tool` does not resolve on $PATH. The policy
    // is referenced, not copied, and must outlive the outputter.
    static std::expected<std::unique_ptr<ClipboardOutputter>, OutputError>
    create(std::string tool, const SecurityPolicy& policy, OutputOptions options = {});

    OutputResult copy_to_clipboard(const std::string& text) override;
    OutputResult type_to_active_window(const std::string& text) override;
    ToolNames tool_names() const override;

    // Only reachable through create().
    ClipboardOutputter(Key, std::string tool, const SecurityPolicy& policy, OutputOptions options);

private:
    const std::string tool_;
    const SecurityPolicy& policy_;
    const OutputOptions options_;
};
