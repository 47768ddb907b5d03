#include "output/text_dispatcher.hpp"

#include "output/output_factory.hpp"

#include <format>

TextDispatcher::TextDispatcher(std::string mode, OutputterFactory factory, const Logger& logger)
    : factory_(std::move(factory)), logger_(logger), mode_(std::move(mode)) {}

OutputResult TextDispatcher::deliver(const std::string& text) {
    auto b = current();
    if (!b) return std::unexpected(b.error());

    logger_.log(std::format("outputting {} bytes via {}", text.size(), b->mode));

    if (b->mode == output_mode::combined) {
        if (auto res = b->outputter->copy_to_clipboard(text); !res) return res;
        return b->outputter->type_to_active_window(text);
    }
    if (b->mode == output_mode::clipboard) {
        return copy_with_fallback(*b, text);
    }
    if (b->mode != output_mode::active_window) {
        logger_.warn(std::format("unknown output mode '{}', typing with clipboard fallback", b->mode));
    }
    return type_with_fallback(*b, text);
}

OutputResult TextDispatcher::output_to_clipboard(const std::string& text) {
    auto b = current();
    if (!b) return std::unexpected(b.error());
    auto res = b->outputter->copy_to_clipboard(text);
    if (!res) logger_.error("failed to copy to clipboard: " + res.error().message);
    return res;
}

OutputResult TextDispatcher::output_by_typing(const std::string& text) {
    auto b = current();
    if (!b) return std::unexpected(b.error());
    auto res = b->outputter->type_to_active_window(text);
    if (!res) logger_.error("failed to type to active window: " + res.error().message);
    return res;
}

std::expected<void, std::string> TextDispatcher::set_mode(const std::string& mode) {
    if (!output_mode::is_valid(mode)) {
        return std::unexpected(std::format(
            "invalid output method: {} (must be 'clipboard', 'active_window' or 'combined')", mode));
    }
    auto b = switch_mode(mode, "requested");
    if (!b) return std::unexpected("failed to reinitialize output: " + b.error().message);
    return {};
}

std::string TextDispatcher::mode() const {
    std::lock_guard lock(mu_);
    return mode_;
}

ToolNames TextDispatcher::tool_names() const {
    std::lock_guard lock(mu_);
    if (!outputter_) return {"unknown", "unknown"};
    return outputter_->tool_names();
}

std::expected<TextDispatcher::Binding, OutputError> TextDispatcher::current() {
    std::lock_guard lock(mu_);
    if (!outputter_) {
        auto out = factory_(mode_);
        if (!out) return std::unexpected(out.error());
        outputter_ = std::move(*out);
    }
    return Binding{mode_, outputter_};
}

std::expected<TextDispatcher::Binding, OutputError>
TextDispatcher::switch_mode(const std::string& mode, std::string_view reason) {
    logger_.warn(std::format("switching output mode to '{}' ({})", mode, reason));

    auto out = factory_(mode);
    if (!out) {
        logger_.error("failed to reinitialize output after mode switch: " + out.error().message);
        return std::unexpected(out.error());
    }

    std::lock_guard lock(mu_);
    mode_ = mode;
    outputter_ = std::move(*out);
    return Binding{mode_, outputter_};
}

OutputResult TextDispatcher::copy_with_fallback(const Binding& b, const std::string& text) {
    auto res = b.outputter->copy_to_clipboard(text);
    if (res) return res;

    logger_.warn("clipboard output failed: " + res.error().message);
    auto next = switch_mode(output_mode::active_window, "clipboard failed");
    if (!next) {
        return output_error(next.error().kind, "failed to switch output mode: " + next.error().message);
    }

    auto typed = next->outputter->type_to_active_window(text);
    if (!typed) {
        return output_error(typed.error().kind,
                            std::format("both clipboard and typing failed - clipboard: {}, typing: {}",
                                        res.error().message, typed.error().message));
    }
    return {};
}

OutputResult TextDispatcher::type_with_fallback(const Binding& b, const std::string& text) {
    auto res = b.outputter->type_to_active_window(text);
    if (res) return res;

    logger_.warn("active window output failed: " + res.error().message);
    auto next = switch_mode(output_mode::clipboard, "typing failed");
    if (!next) {
        return output_error(next.error().kind, "failed to switch output mode: " + next.error().message);
    }

    auto copied = next->outputter->copy_to_clipboard(text);
    if (!copied) {
        return output_error(copied.error().kind,
                            std::format("both typing and clipboard failed - typing: {}, clipboard: {}",
                                        res.error().message, copied.error().message));
    }
    logger_.log("copied text to clipboard after mode switch");
    return {};
}
