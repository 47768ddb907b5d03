#include "config.hpp"
#include "logger.hpp"
#include "output/output_factory.hpp"
#include "output/text_dispatcher.hpp"
#include "platform/environment.hpp"
#include "security/command_policy.hpp"

#include <format>
#include <iostream>
#include <iterator>
#include <print>
#include <string>

static void print_usage() {
    std::println("Usage: speak-dispatch [options] [TEXT...]");
    std::println("Delivers TEXT (or stdin) to the clipboard or the focused window.");
    std::println("Options:");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -m, --mode MODE     clipboard, active_window or combined");
    std::println("      --clipboard     Same as --mode clipboard");
    std::println("      --type          Same as --mode active_window");
    std::println("  -i, --info          Print detected environment and tools, then exit");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -h, --help          Show this help");
}

static void print_info(const Config& config, const SecurityPolicy& policy) {
    auto env = platform::detect_environment();
    ToolSelector selector;
    std::println("environment:   {}", platform::to_string(env));
    std::println("desktop:       {}", platform::detect_desktop_environment());
    std::println("mode:          {}", config.output.default_mode);
    std::println("clipboard:     {}", selector.select_clipboard_tool(env, config.output));
    std::println("type:          {}", selector.select_type_tool(env, config.output));
    std::println("tray watcher:  {}", platform::has_tray_watcher(policy) ? "yes" : "no");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool info = false;
    std::string config_path;
    std::string mode;
    std::string text;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--info" || arg == "-i") {
            info = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--mode" || arg == "-m") {
            if (i + 1 < argc) mode = argv[++i];
        } else if (arg == "--clipboard") {
            mode = output_mode::clipboard;
        } else if (arg == "--type") {
            mode = output_mode::active_window;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            if (!text.empty()) text += ' ';
            text += arg;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!mode.empty()) config.output.default_mode = mode;

    Logger logger("speak-dispatch", verbose);
    SecurityPolicy policy(config.security.allowed_commands);

    if (info) {
        print_info(config, policy);
        return 0;
    }

    if (text.empty()) {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
    }
    if (text.empty()) {
        logger.error("no text to deliver");
        return 1;
    }

    auto env = platform::detect_environment();
    TextDispatcher dispatcher(
        config.output.default_mode,
        [&](const std::string& m) -> std::expected<std::shared_ptr<Outputter>, OutputError> {
            Config::Output out = config.output;
            out.default_mode = m;
            auto made = make_outputter(out, env, policy, logger);
            if (!made && m == output_mode::clipboard) {
                logger.warn("failed to initialize text outputter: " + made.error().message);
                made = make_fallback_clipboard_outputter(env, policy, logger);
            }
            if (!made) return std::unexpected(made.error());
            return std::shared_ptr<Outputter>(std::move(*made));
        },
        logger);

    auto res = dispatcher.deliver(text);
    if (!res) {
        logger.error(std::format("{} ({})", res.error().message, to_string(res.error().kind)));
        return 1;
    }

    auto tools = dispatcher.tool_names();
    logger.log(std::format("delivered via {} (clipboard: {}, type: {})", dispatcher.mode(),
                           tools.clipboard.empty() ? "-" : tools.clipboard,
                           tools.type.empty() ? "-" : tools.type));
    return 0;
}
