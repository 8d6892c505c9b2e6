#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/util.hpp"

TEST_CASE("Text helpers", "[util]") {
    SECTION("Lowercase and trim") {
        REQUIRE(util::to_lower("Tears Of JOY") == "tears of joy");
        REQUIRE(util::trim("  reunion \n") == "reunion");
    }

    SECTION("Keyword containment") {
        REQUIRE(util::contains("she was crying", "cry"));
        REQUIRE_FALSE(util::contains("anything", ""));
        REQUIRE(util::count_matches("family reunion", {"family", "reunion", "puppy"}) == 2);
    }

    SECTION("Clamp") {
        REQUIRE(util::clamp01(-0.2) == Catch::Approx(0.0));
        REQUIRE(util::clamp01(1.7) == Catch::Approx(1.0));
    }
}

TEST_CASE("Truncation", "[util]") {
    SECTION("Short text is unchanged") {
        REQUIRE(util::truncate("short", 10) == "short");
        REQUIRE(util::truncate("exactly", 7) == "exactly");
    }

    SECTION("ASCII is cut at the limit") {
        REQUIRE(util::truncate("abcdefgh", 3) == "abc...");
    }

    SECTION("Multi-byte characters are not split") {
        // "h" + U+00E9 (2 bytes) + "llo"
        REQUIRE(util::truncate("h\xC3\xA9llo", 2) == "h...");
        REQUIRE(util::truncate("h\xC3\xA9llo", 3) == "h\xC3\xA9...");

        // U+1F62D (4 bytes) after "so sad "
        std::string comment = "so sad \xF0\x9F\x98\xAD at 2:15";
        for (size_t n = 8; n < 11; n++) {
            REQUIRE(util::truncate(comment, n) == "so sad ...");
        }
        REQUIRE(util::truncate(comment, 11) == "so sad \xF0\x9F\x98\xAD...");
    }
}
