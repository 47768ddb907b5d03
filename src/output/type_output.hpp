#pragma once

#include "output/outputter.hpp"
#include "security/command_policy.hpp"

#include <expected>
#include <memory>

// Simulates keystrokes into the focused window with xdotool, wtype or ydotool.
// Clipboard copies are not offered.
class TypeOutputter : public Outputter {
    struct Key {
        explicit Key() = default;
    };

public:
    // Fails with ToolNotFound if `tool` does not resolve on $PATH. The policy
    // is referenced, not copied, and must outlive the outputter.
    static std::expected<std::unique_ptr<TypeOutputter>, OutputError>
    create(std::string tool, const SecurityPolicy& policy, OutputOptions options = {});

    // Two fallbacks apply:
    //  - ydotool on Wayland cannot type non-ASCII text; such text fails with
    //    EncodingUnsupported before anything is spawned.
    //  - if wtype fails and ydotool is allowed and installed, ydotool is tried
    //    once with the same text.
    OutputResult type_to_active_window(const std::string& text) override;
    OutputResult copy_to_clipboard(const std::string& text) override;
    ToolNames tool_names() const override;

    // Only reachable through create().
    TypeOutputter(Key, std::string tool, const SecurityPolicy& policy, OutputOptions options);

private:
    OutputResult type_with(const std::string& tool, const std::string& text) const;

    const std::string tool_;
    const SecurityPolicy& policy_;
    const OutputOptions options_;
};

bool contains_non_ascii(const std::string& text);
