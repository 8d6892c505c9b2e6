#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/profile_registry.hpp"
#include "../src/errors.hpp"

TEST_CASE("Default profile registry", "[profiles]") {
    const auto& registry = ProfileRegistry::instance();

    SECTION("Three known categories") {
        auto ids = registry.ids();
        REQUIRE(ids.size() == 3);
        REQUIRE(registry.contains("heartwarming"));
        REQUIRE(registry.contains("motivational"));
        REQUIRE(registry.contains("traumatic"));
    }

    SECTION("Weights sum to one and gating component is weighted") {
        for (const auto& id : registry.ids()) {
            const auto& p = registry.profile(id);
            double total = 0.0;
            for (const auto& entry : p.component_weights) total += entry.second;
            REQUIRE(total == Catch::Approx(1.0));
            REQUIRE(p.component_weights.size() == 6);
            REQUIRE(p.component_weights.count(p.gating.component) == 1);
        }
    }

    SECTION("Category-specific gating rules") {
        REQUIRE(registry.profile("heartwarming").gating.component == "authenticity");
        REQUIRE(registry.profile("motivational").gating.component == "achievement_authenticity");
        REQUIRE(registry.profile("traumatic").gating.component == "responsible_handling");
        REQUIRE(registry.profile("traumatic").gating.penalty == Catch::Approx(0.4));
    }

    SECTION("Unknown category fails") {
        REQUIRE_THROWS_AS(registry.profile("unknown_category"), InvalidCategory);
        REQUIRE_FALSE(registry.contains("unknown_category"));
    }
}

TEST_CASE("Profile validation at load", "[profiles]") {
    auto profiles = default_profiles();

    SECTION("Weights not summing to one") {
        profiles[0].component_weights["authenticity"] = 0.2;
        REQUIRE_THROWS_AS(ProfileRegistry(profiles), ConfigurationError);
    }

    SECTION("Weight for a component without an assessor") {
        profiles[0].component_weights.erase("speech_patterns");
        profiles[0].component_weights["laugh_track"] = 0.07;
        REQUIRE_THROWS_AS(ProfileRegistry(profiles), ConfigurationError);
    }

    SECTION("Gating component not weighted") {
        profiles[2].gating.component = "visual_warmth";
        REQUIRE_THROWS_AS(ProfileRegistry(profiles), ConfigurationError);
    }

    SECTION("Duplicate ids") {
        profiles.push_back(profiles[1]);
        REQUIRE_THROWS_AS(ProfileRegistry(profiles), ConfigurationError);
    }

    SECTION("A new category is just another profile") {
        auto extra = profiles[0];
        extra.id = "wholesome_pets";
        profiles.push_back(extra);
        ProfileRegistry registry(profiles);
        REQUIRE(registry.contains("wholesome_pets"));
    }
}
