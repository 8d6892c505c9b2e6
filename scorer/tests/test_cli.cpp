#include <catch2/catch_test_macros.hpp>
#include "../src/cli.hpp"
#include "../src/config.hpp"
#include <stdexcept>
#include <stdlib.h>

TEST_CASE("Command line parsing", "[cli]") {
    SECTION("Defaults") {
        auto opts = CliParser::parse({"video.json"}, "heartwarming");
        REQUIRE(opts.is_valid());
        REQUIRE(opts.category == "heartwarming");
        REQUIRE_FALSE(opts.json_output);
        REQUIRE(opts.refs.size() == 1);
    }

    SECTION("All options") {
        auto opts = CliParser::parse({"--category", "traumatic", "--json", "--save", "a.json", "dQw4w9WgXcQ"},
                                     "heartwarming");
        REQUIRE(opts.is_valid());
        REQUIRE(opts.category == "traumatic");
        REQUIRE(opts.json_output);
        REQUIRE(opts.save_history);
        REQUIRE(opts.refs.size() == 2);
        REQUIRE(opts.refs[1] == "dQw4w9WgXcQ");
    }

    SECTION("Short category flag") {
        auto opts = CliParser::parse({"-c", "motivational", "x"}, "heartwarming");
        REQUIRE(opts.category == "motivational");
    }

    SECTION("History alone needs no video") {
        auto opts = CliParser::parse({"--history"}, "heartwarming");
        REQUIRE(opts.is_valid());
        REQUIRE(opts.show_history);
    }

    SECTION("Clearing history needs no video") {
        auto opts = CliParser::parse({"--clear-history"}, "heartwarming");
        REQUIRE(opts.is_valid());
        REQUIRE(opts.clear_history);
        REQUIRE_FALSE(opts.show_history);

        auto with_video = CliParser::parse({"--clear-history", "--save", "a.json"}, "heartwarming");
        REQUIRE(with_video.clear_history);
        REQUIRE(with_video.refs.size() == 1);
    }

    SECTION("Errors") {
        REQUIRE(CliParser::parse({}, "heartwarming").error == "No video given");
        REQUIRE(CliParser::parse({"x", "--category"}, "heartwarming").error == "Missing value for --category");
        REQUIRE(CliParser::parse({"--verbose", "x"}, "heartwarming").error == "Unknown option: --verbose");
    }

    SECTION("Usage mentions the program") {
        auto usage = CliParser::usage("clipscout_scorer");
        REQUIRE(usage.find("clipscout_scorer") != std::string::npos);
        REQUIRE(usage.find("--clear-history") != std::string::npos);
    }
}

TEST_CASE("Config from environment", "[config]") {
    unsetenv("DEFAULT_CATEGORY");
    unsetenv("REPORT_FORMAT");
    unsetenv("REPORT_MAX_MOMENTS");
    unsetenv("HISTORY_PATH");

    SECTION("Defaults validate") {
        auto cfg = Config::from_env();
        REQUIRE(cfg.default_category == "heartwarming");
        REQUIRE(cfg.report_format == "text");
        REQUIRE(cfg.report_max_moments == 3);
        REQUIRE(cfg.history_path.empty());
        REQUIRE_NOTHROW(cfg.validate());
    }

    SECTION("Unknown default category") {
        setenv("DEFAULT_CATEGORY", "funny", 1);
        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
        unsetenv("DEFAULT_CATEGORY");
    }

    SECTION("Bad report settings") {
        setenv("REPORT_FORMAT", "xml", 1);
        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
        unsetenv("REPORT_FORMAT");

        setenv("REPORT_MAX_MOMENTS", "abc", 1);
        REQUIRE(Config::from_env().report_max_moments == 3);
        setenv("REPORT_MAX_MOMENTS", "0", 1);
        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
        unsetenv("REPORT_MAX_MOMENTS");
    }
}
