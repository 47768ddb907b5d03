#include <catch2/catch_test_macros.hpp>

#include "logger.hpp"

#include <cstdio>
#include <string>

namespace {

std::string drain(std::FILE* f) {
    std::fflush(f);
    std::rewind(f);
    std::string out;
    char buf[256];
    while (auto n = std::fread(buf, 1, sizeof(buf), f)) out.append(buf, n);
    return out;
}

} // namespace

TEST_CASE("Logger", "[logger]") {
    std::FILE* f = std::tmpfile();
    REQUIRE(f != nullptr);

    SECTION("QuietByDefault") {
        Logger logger("speak-dispatch", false, f);
        logger.log("details");
        logger.warn("careful");
        logger.error("broken");
        REQUIRE(drain(f) == "[speak-dispatch] warning: careful\n[speak-dispatch] error: broken\n");
    }

    SECTION("VerbosePrintsLog") {
        Logger logger("speak-dispatch", true, f);
        logger.log("details");
        REQUIRE(logger.verbose());
        REQUIRE(drain(f) == "[speak-dispatch] details\n");
    }

    std::fclose(f);
}
