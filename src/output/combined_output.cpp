#include "output/combined_output.hpp"

std::expected<std::unique_ptr<CombinedOutputter>, OutputError>
CombinedOutputter::create(std::string clipboard_tool, std::string type_tool,
                          const SecurityPolicy& policy, OutputOptions options) {
    auto clipboard = ClipboardOutputter::create(std::move(clipboard_tool), policy, options);
    if (!clipboard) {
        return output_error(clipboard.error().kind,
                            "failed to create clipboard outputter: " + clipboard.error().message);
    }

    auto typer = TypeOutputter::create(std::move(type_tool), policy, options);
    if (!typer) {
        return output_error(typer.error().kind,
                            "failed to create type outputter: " + typer.error().message);
    }

    return std::make_unique<CombinedOutputter>(Key{}, std::move(*clipboard), std::move(*typer));
}

CombinedOutputter::CombinedOutputter(Key, std::unique_ptr<ClipboardOutputter> clipboard,
                                     std::unique_ptr<TypeOutputter> typer)
    : clipboard_(std::move(clipboard)), typer_(std::move(typer)) {}

OutputResult CombinedOutputter::copy_to_clipboard(const std::string& text) {
    return clipboard_->copy_to_clipboard(text);
}

OutputResult CombinedOutputter::type_to_active_window(const std::string& text) {
    return typer_->type_to_active_window(text);
}

ToolNames CombinedOutputter::tool_names() const {
    return {clipboard_->tool_names().clipboard, typer_->tool_names().type};
}
