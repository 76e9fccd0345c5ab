#include <catch2/catch.hpp>
#include <ulid/log.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace ulid;

// Runs fn with stderr pointed at a scratch file and returns what was written.
template<typename F>
static std::string stderr_of(F fn) {
    std::string path = "/tmp/ulid_test_log_" + std::to_string(getpid()) + ".txt";
    std::fflush(stderr);
    int saved = dup(fileno(stderr));
    FILE* sink = std::fopen(path.c_str(), "w");
    REQUIRE(sink != nullptr);
    dup2(fileno(sink), fileno(stderr));

    fn();

    std::fflush(stderr);
    dup2(saved, fileno(stderr));
    close(saved);
    std::fclose(sink);

    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    std::remove(path.c_str());
    return ss.str();
}

TEST_CASE("parse_level accepts every level name", "[log]") {
    for (log::Level lvl : {log::Trace, log::Debug, log::Info, log::Warn, log::Error}) {
        auto r = log::parse_level(log::level_name(lvl));
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == lvl);
    }
}

TEST_CASE("parse_level rejects unknown names with a Config error", "[log]") {
    auto r = log::parse_level("verbose");
    REQUIRE(r.failed_with(UlidError::Config));
    REQUIRE(r.error().message == "unknown log level 'verbose'");
    REQUIRE(r.error().hint.find("trace, debug, info, warn, error") != std::string::npos);
    REQUIRE(log::parse_level("INFO").is_err());
    REQUIRE(log::parse_level("").is_err());
}

TEST_CASE("quiet level keeps only errors", "[log]") {
    log::set_color_enabled(false);
    log::set_level(log::Error);

    auto out = stderr_of([] {
        log::debug("generating %d id(s) as %s", 3, "text");
        log::warn("config file %s not found", "x.toml");
        log::error("%s", "error[InvalidLength]: ULID string must be 26 characters");
    });
    REQUIRE(out == "error: error[InvalidLength]: ULID string must be 26 characters\n");

    log::set_level(log::Info);
}

TEST_CASE("verbose level shows debug but not trace", "[log]") {
    log::set_color_enabled(false);
    log::set_level(log::Debug);

    auto out = stderr_of([] {
        log::trace("stored %s", "01ARZ3NDEKTSV4RRFFQ69G5FAV");
        log::debug("opened id store %s", "/tmp/ids.db");
    });
    REQUIRE(out == "debug: opened id store /tmp/ids.db\n");

    log::set_level(log::Info);
}

TEST_CASE("colored output wraps the level name", "[log]") {
    log::set_level(log::Info);
    log::set_color_enabled(true);
    REQUIRE(log::is_color_enabled());

    auto out = stderr_of([] {
        log::info("count: %d", 2);
    });
    REQUIRE(out == "\033[32minfo\033[0m: count: 2\n");

    log::set_color_enabled(false);
    REQUIRE_FALSE(log::is_color_enabled());
}
