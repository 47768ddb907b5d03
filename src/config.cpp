#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("default_mode")) cfg.output.default_mode = o["default_mode"].get<std::string>();
            if (o.contains("clipboard_tool")) cfg.output.clipboard_tool = o["clipboard_tool"].get<std::string>();
            if (o.contains("type_tool")) cfg.output.type_tool = o["type_tool"].get<std::string>();
            if (o.contains("timeout_ms")) {
                // poll() takes an int; negative values would mean "wait forever".
                auto ms = o["timeout_ms"].get<int64_t>();
                if (ms < 0 || ms > std::numeric_limits<int>::max()) {
                    std::println(stderr, "config: output.timeout_ms {} out of range, using no timeout", ms);
                } else {
                    cfg.output.timeout_ms = static_cast<uint32_t>(ms);
                }
            }
        }

        // An explicitly empty list is kept: it denies every tool.
        if (j.contains("security")) {
            auto& s = j["security"];
            if (s.contains("allowed_commands")) {
                cfg.security.allowed_commands = s["allowed_commands"].get<std::vector<std::string>>();
            }
        }

    } catch (const json::exception& e) {
        // The allowlist the file meant to set is unknown, so nothing may run.
        std::println(stderr, "config: parse error: {}, all commands disabled", e.what());
        Config failed;
        failed.security.allowed_commands.clear();
        return failed;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
