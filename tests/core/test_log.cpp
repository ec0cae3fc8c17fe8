// forge_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <addon_forge/core/log.hpp>

#include "test_support.hpp"

using namespace forge_core;

TEST_CASE("Log level parsing", "[core][log]") {
    SECTION("known names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("unknown names") {
        REQUIRE_FALSE(parse_log_level("loud").has_value());
        REQUIRE_FALSE(parse_log_level("").has_value());
    }

    SECTION("names round-trip") {
        for (auto level : {spdlog::level::debug, spdlog::level::info, spdlog::level::err}) {
            REQUIRE(parse_log_level(log_level_name(level)) == level);
        }
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns same logger") {
        REQUIRE(get_logger("release") == release_logger());
        REQUIRE(get_logger("signing") == signing_logger());
        REQUIRE(release_logger() != signing_logger());
    }

    SECTION("logger names") {
        REQUIRE(core_logger()->name() == "forge_core");
        REQUIRE(release_logger()->name() == "release");
    }
}

TEST_CASE("Global log level", "[core][log]") {
    auto previous = get_global_log_level();

    set_global_log_level(spdlog::level::err);
    REQUIRE(get_global_log_level() == spdlog::level::err);
    REQUIRE(release_logger()->level() == spdlog::level::err);

    set_global_log_level(previous);
    REQUIRE(release_logger()->level() == previous);
}

TEST_CASE("Structured logging", "[core][log]") {
    forge_test::LogCapture capture(release_logger());

    log_structured(spdlog::level::warn, "release", "archive skipped",
        {{"addon", "main"}, {"stage", "copy"}});

    auto text = capture.text();
    REQUIRE(text.find("archive skipped") != std::string::npos);
    REQUIRE(text.find("addon=\"main\"") != std::string::npos);
    REQUIRE(text.find("stage=\"copy\"") != std::string::npos);
}

TEST_CASE("Log scope reports completion", "[core][log]") {
    auto previous = get_global_log_level();
    set_global_log_level(spdlog::level::debug);
    {
        forge_test::LogCapture capture(core_logger());
        {
            FORGE_LOG_SCOPE("scoped work");
        }
        REQUIRE(capture.count("scoped work finished") == 1);
    }
    {
        forge_test::LogCapture capture(core_logger());
        {
            FORGE_LOG_SCOPE("first step");
            FORGE_LOG_SCOPE("second step");
        }
        REQUIRE(capture.count("first step finished") == 1);
        REQUIRE(capture.count("second step finished") == 1);
    }
    set_global_log_level(previous);
}
