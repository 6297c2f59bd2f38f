#include <catch2/catch.hpp>
#include <finl/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

using namespace finl::log;

// Helper: capture log output from a callable through a temporary file
static std::string capture_log(std::function<void()> fn) {
    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    set_output(tmp);
    fn();
    set_output(nullptr);

    std::fflush(tmp);
    std::rewind(tmp);
    std::string output;
    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        output.append(buf, n);
    }
    std::fclose(tmp);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error, Off}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Warn);
}

TEST_CASE("level_name() and level_from_name()", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Error)) == "error");

    Level lvl = Warn;
    REQUIRE(level_from_name("debug", lvl));
    REQUIRE(lvl == Debug);
    REQUIRE(level_from_name("off", lvl));
    REQUIRE(lvl == Off);
    REQUIRE_FALSE(level_from_name("loud", lvl));
    REQUIRE(lvl == Off);
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled() == true);
    set_color_enabled(false);
    REQUIRE(is_color_enabled() == false);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] {
        info("should not appear");
        debug("nor this");
    });
    REQUIRE(output.empty());
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output.find("finl warn: this is a warning") != std::string::npos);
    REQUIRE(output.find("finl error: this is an error") != std::string::npos);
}

TEST_CASE("Off silences everything", "[log]") {
    set_level(Off);
    REQUIRE_FALSE(enabled(Error));
    auto output = capture_log([] { error("silenced"); });
    REQUIRE(output.empty());
    set_level(Warn);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_log([] {
        info("value: %d, name: %s", 42, "test");
    });
    REQUIRE(output.find("info:") != std::string::npos);
    REQUIRE(output.find("value: 42") != std::string::npos);
    REQUIRE(output.find("name: test") != std::string::npos);
    set_level(Warn);
}
