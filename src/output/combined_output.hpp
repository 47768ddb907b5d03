#pragma once

#include "output/clipboard_output.hpp"
#include "output/type_output.hpp"

#include <expected>
#include <memory>

// Owns one clipboard and one type outputter and forwards to them.
class CombinedOutputter : public Outputter {
    struct Key {
        explicit Key() = default;
    };

public:
    static std::expected<std::unique_ptr<CombinedOutputter>, OutputError>
    create(std::string clipboard_tool, std::string type_tool,
           const SecurityPolicy& policy, OutputOptions options = {});

    OutputResult copy_to_clipboard(const std::string& text) override;
    OutputResult type_to_active_window(const std::string& text) override;
    ToolNames tool_names() const override;

    // Only reachable through create().
    CombinedOutputter(Key, std::unique_ptr<ClipboardOutputter> clipboard,
                      std::unique_ptr<TypeOutputter> typer);

private:
    std::unique_ptr<ClipboardOutputter> clipboard_;
    std::unique_ptr<TypeOutputter> typer_;
};
