#pragma once

#include "logger.hpp"
#include "output/outputter.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

// Delivers recognized text according to the current output mode. When the
// mode's operation fails, the dispatcher switches to the other mode (in
// memory), rebuilds its outputter and tries once more.
class TextDispatcher {
public:
    using OutputterFactory =
        std::function<std::expected<std::shared_ptr<Outputter>, OutputError>(const std::string& mode)>;

    TextDispatcher(std::string mode, OutputterFactory factory, const Logger& logger);

    TextDispatcher(const TextDispatcher&) = delete;
    TextDispatcher& operator=(const TextDispatcher&) = delete;

    OutputResult deliver(const std::string& text);

    // Bypass the mode; no fallback.
    OutputResult output_to_clipboard(const std::string& text);
    OutputResult output_by_typing(const std::string& text);

    std::expected<void, std::string> set_mode(const std::string& mode);
    std::string mode() const;

    // {"unknown", "unknown"} until an outputter has been built.
    ToolNames tool_names() const;

private:
    struct Binding {
        std::string mode;
        std::shared_ptr<Outputter> outputter;
    };

    std::expected<Binding, OutputError> current();
    std::expected<Binding, OutputError> switch_mode(const std::string& mode, std::string_view reason);

    OutputResult copy_with_fallback(const Binding& b, const std::string& text);
    OutputResult type_with_fallback(const Binding& b, const std::string& text);

    OutputterFactory factory_;
    const Logger& logger_;

    mutable std::mutex mu_;
    std::string mode_;
    std::shared_ptr<Outputter> outputter_;
};
