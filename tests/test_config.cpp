#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "security/command_policy.hpp"
#include "test_helpers.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "sd_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        [[maybe_unused]] auto n = ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.output.default_mode == "clipboard");
        REQUIRE(cfg.output.clipboard_tool == "auto");
        REQUIRE(cfg.output.type_tool == "auto");
        REQUIRE(cfg.output.timeout_ms == 0);
        REQUIRE(cfg.security.allowed_commands ==
                std::vector<std::string>{"xsel", "wl-copy", "xdotool", "wtype", "ydotool", "dbus-send"});
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "output": {
                "default_mode": "active_window",
                "clipboard_tool": "wl-copy",
                "type_tool": "ydotool",
                "timeout_ms": 5000
            },
            "security": { "allowed_commands": ["wl-copy", "ydotool"] }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.output.default_mode == "active_window");
        REQUIRE(cfg.output.clipboard_tool == "wl-copy");
        REQUIRE(cfg.output.type_tool == "ydotool");
        REQUIRE(cfg.output.timeout_ms == 5000);
        REQUIRE(cfg.security.allowed_commands == std::vector<std::string>{"wl-copy", "ydotool"});
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "output": { "type_tool": "wtype" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.output.type_tool == "wtype");
        // Other fields retain defaults
        REQUIRE(cfg.output.default_mode == "clipboard");
        REQUIRE(cfg.output.clipboard_tool == "auto");
        REQUIRE(cfg.security.allowed_commands.size() == 6);
    }

    SECTION("EmptyAllowlistKept") {
        TmpFile f(R"({ "security": { "allowed_commands": [] } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.security.allowed_commands.empty());
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Output settings fall back to defaults, the allowlist to nothing
        REQUIRE(cfg.output.default_mode == "clipboard");
        REQUIRE(cfg.security.allowed_commands.empty());
    }

    SECTION("WrongTypeDisablesAllCommands") {
        TmpFile f(R"({ "output": { "default_mode": "combined", "timeout_ms": "soon" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.output.default_mode == "clipboard");
        REQUIRE(cfg.output.timeout_ms == 0);
        REQUIRE(cfg.security.allowed_commands.empty());
    }

    SECTION("EmptyAllowlistSurvivesTypeErrorElsewhere") {
        TmpFile f(R"({ "security": { "allowed_commands": [] }, "output": { "timeout_ms": "x" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.security.allowed_commands.empty());
        SecurityPolicy policy(cfg.security.allowed_commands);
        REQUIRE_FALSE(policy.is_command_allowed("xdotool"));
    }

    SECTION("NegativeTimeoutIgnored") {
        TmpFile f(R"({ "output": { "timeout_ms": -1 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.output.timeout_ms == 0);
        // Not a parse error: the rest of the file still applies
        REQUIRE(cfg.security.allowed_commands.size() == 6);
    }

    SECTION("OversizedTimeoutIgnored") {
        TmpFile f(R"({ "output": { "timeout_ms": 4294967295, "type_tool": "wtype" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.output.timeout_ms == 0);
        REQUIRE(cfg.output.type_tool == "wtype");
    }

    SECTION("LargestTimeoutAccepted") {
        TmpFile f(R"({ "output": { "timeout_ms": 2147483647 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.output.timeout_ms == 2147483647u);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/sd_test_nonexistent_config_file.json");
        REQUIRE(cfg.output.default_mode == "clipboard");
    }

    SECTION("LoadDefaultFromXdgConfigHome") {
        auto dir = std::filesystem::temp_directory_path() / ("sd_test_xdg_" + std::to_string(getpid()));
        std::filesystem::create_directories(dir / "speak-dispatch");
        std::ofstream(dir / "speak-dispatch" / "config.json") << R"({ "output": { "default_mode": "combined" } })";

        {
            test::ScopedEnv xdg("XDG_CONFIG_HOME", dir.string());
            auto cfg = Config::load_default();
            REQUIRE(cfg.output.default_mode == "combined");
        }
        std::filesystem::remove_all(dir);
    }

    SECTION("LoadDefaultWithoutFile") {
        auto dir = std::filesystem::temp_directory_path() / ("sd_test_xdg_empty_" + std::to_string(getpid()));
        test::ScopedEnv xdg("XDG_CONFIG_HOME", dir.string());
        auto cfg = Config::load_default();
        REQUIRE(cfg.output.default_mode == "clipboard");
    }
}
