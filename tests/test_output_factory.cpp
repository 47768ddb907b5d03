#include <catch2/catch_test_macros.hpp>

#include "output/output_factory.hpp"
#include "test_helpers.hpp"

#include <cstdio>

using platform::EnvironmentClass;

namespace {

// Keeps test output quiet.
struct NullLogger {
    std::FILE* sink = std::fopen("/dev/null", "w");
    Logger logger{"test", true, sink ? sink : stderr};
    ~NullLogger() { if (sink) std::fclose(sink); }
};

ToolSelector nothing_installed() {
    return ToolSelector([](const std::string&) { return false; });
}

} // namespace

TEST_CASE("Outputter factory", "[factory]") {
    test::FakeToolDir tools;
    auto path = tools.path_guard();
    NullLogger log;
    SecurityPolicy policy({"xsel", "wl-copy", "xdotool", "wtype", "ydotool"});
    Config::Output cfg;

    SECTION("ClipboardModeOnX11") {
        tools.add_recording_tool("xsel");
        auto out = make_outputter(cfg, EnvironmentClass::X11, policy, log.logger, nothing_installed());
        REQUIRE(out.has_value());
        REQUIRE((*out)->tool_names() == ToolNames{"xsel", ""});
    }

    SECTION("ClipboardModeOnWayland") {
        tools.add_recording_tool("wl-copy");
        auto out = make_outputter(cfg, EnvironmentClass::Wayland, policy, log.logger, nothing_installed());
        REQUIRE(out.has_value());
        REQUIRE((*out)->tool_names() == ToolNames{"wl-copy", ""});
    }

    SECTION("ActiveWindowMode") {
        tools.add_recording_tool("xdotool");
        cfg.default_mode = "active_window";
        auto out = make_outputter(cfg, EnvironmentClass::X11, policy, log.logger, nothing_installed());
        REQUIRE(out.has_value());
        REQUIRE((*out)->tool_names() == ToolNames{"", "xdotool"});
    }

    SECTION("CombinedMode") {
        tools.add_recording_tool("wl-copy");
        tools.add_recording_tool("wtype");
        cfg.default_mode = "combined";
        auto out = make_outputter(cfg, EnvironmentClass::Wayland, policy, log.logger,
                                  ToolSelector([](const std::string& t) { return t == "wtype"; }));
        REQUIRE(out.has_value());
        REQUIRE((*out)->tool_names() == ToolNames{"wl-copy", "wtype"});
    }

    SECTION("UnknownModeMeansClipboard") {
        tools.add_recording_tool("xsel");
        cfg.default_mode = "web";
        auto out = make_outputter(cfg, EnvironmentClass::X11, policy, log.logger, nothing_installed());
        REQUIRE(out.has_value());
        REQUIRE((*out)->tool_names().clipboard == "xsel");
    }

    SECTION("ExplicitToolOverride") {
        tools.add_recording_tool("wl-copy");
        cfg.clipboard_tool = "wl-copy";
        auto out = make_outputter(cfg, EnvironmentClass::X11, policy, log.logger, nothing_installed());
        REQUIRE(out.has_value());
        REQUIRE((*out)->tool_names().clipboard == "wl-copy");
    }

    SECTION("SelectedToolNotAllowed") {
        tools.add_recording_tool("xsel");
        SecurityPolicy deny;
        auto out = make_outputter(cfg, EnvironmentClass::X11, deny, log.logger, nothing_installed());
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == OutputErrorKind::ToolNotAllowed);
        REQUIRE(out.error().message == "clipboard tool not allowed: xsel");
    }

    SECTION("TypeToolNotAllowed") {
        tools.add_recording_tool("xdotool");
        cfg.default_mode = "active_window";
        SecurityPolicy clipboard_only({"xsel"});
        auto out = make_outputter(cfg, EnvironmentClass::X11, clipboard_only, log.logger, nothing_installed());
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == OutputErrorKind::ToolNotAllowed);
    }

    SECTION("SelectedToolMissing") {
        auto out = make_outputter(cfg, EnvironmentClass::X11, policy, log.logger, nothing_installed());
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == OutputErrorKind::ToolNotFound);
    }

    SECTION("TimeoutPropagates") {
        tools.add_script("xsel", "exec /bin/sleep 5");
        cfg.timeout_ms = 100;
        auto out = make_outputter(cfg, EnvironmentClass::X11, policy, log.logger, nothing_installed());
        REQUIRE(out.has_value());
        REQUIRE((*out)->copy_to_clipboard("x").error().kind == OutputErrorKind::Timeout);
    }
}

TEST_CASE("Fallback clipboard outputter", "[factory]") {
    test::FakeToolDir tools;
    auto path = tools.path_guard();
    NullLogger log;
    SecurityPolicy policy({"xsel", "wl-copy"});

    SECTION("PrefersWlCopyOnWayland") {
        tools.add_recording_tool("wl-copy");
        tools.add_recording_tool("xsel");
        auto out = make_fallback_clipboard_outputter(EnvironmentClass::Wayland, policy, log.logger);
        REQUIRE(out.has_value());
        REQUIRE((*out)->tool_names().clipboard == "wl-copy");
    }

    SECTION("XselOtherwise") {
        tools.add_recording_tool("wl-copy");
        tools.add_recording_tool("xsel");
        auto out = make_fallback_clipboard_outputter(EnvironmentClass::X11, policy, log.logger);
        REQUIRE(out.has_value());
        REQUIRE((*out)->tool_names().clipboard == "xsel");
    }

    SECTION("XselWhenWlCopyMissing") {
        tools.add_recording_tool("xsel");
        auto out = make_fallback_clipboard_outputter(EnvironmentClass::Wayland, policy, log.logger);
        REQUIRE(out.has_value());
        REQUIRE((*out)->tool_names().clipboard == "xsel");
    }

    SECTION("NothingAvailable") {
        auto out = make_fallback_clipboard_outputter(EnvironmentClass::Wayland, policy, log.logger);
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == OutputErrorKind::ToolNotFound);
    }
}
