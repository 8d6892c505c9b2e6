#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/authenticity.hpp"
#include "../src/confidence.hpp"
#include "../src/profile_registry.hpp"
#include "fixtures.hpp"

TEST_CASE("Confidence estimate", "[confidence]") {
    const auto& profile = ProfileRegistry::instance().profile("heartwarming");
    std::map<std::string, double> weak_gate{{"authenticity", 0.2}};

    SECTION("Floor with no evidence") {
        auto video = make_video("t");
        REQUIRE(ConfidenceEstimator::estimate(profile, video, weak_gate) == Catch::Approx(0.3));
    }

    SECTION("Adding evidence never lowers confidence") {
        auto video = make_video("t");
        double c0 = ConfidenceEstimator::estimate(profile, video, weak_gate);

        video.comments = std::vector<std::string>(11, "nice");
        double c1 = ConfidenceEstimator::estimate(profile, video, weak_gate);

        video.transcript = make_transcript("hello everyone");
        double c2 = ConfidenceEstimator::estimate(profile, video, weak_gate);

        video.view_count = 5000;
        double c3 = ConfidenceEstimator::estimate(profile, video, weak_gate);

        REQUIRE(c1 == Catch::Approx(c0 + 0.25));
        REQUIRE(c2 == Catch::Approx(c1 + 0.15));
        REQUIRE(c3 == Catch::Approx(c2 + 0.15));
        REQUIRE(c3 <= 1.0);
    }

    SECTION("Comment threshold is exclusive") {
        auto video = make_video("t");
        video.comments = std::vector<std::string>(10, "nice");
        REQUIRE(ConfidenceEstimator::estimate(profile, video, weak_gate) == Catch::Approx(0.3));
    }

    SECTION("All evidence saturates at one") {
        auto video = make_video("t");
        video.comments = std::vector<std::string>(50, "nice");
        video.transcript = make_transcript("hello");
        video.view_count = 100000;
        ChannelInfo channel;
        channel.subscriber_count = 500000;
        video.channel_info = channel;

        double c = ConfidenceEstimator::estimate(profile, video, {{"authenticity", 0.8}});
        REQUIRE(c == Catch::Approx(1.0));
    }

    SECTION("Traumatic needs more comments") {
        const auto& traumatic = ProfileRegistry::instance().profile("traumatic");
        auto video = make_video("t");
        video.comments = std::vector<std::string>(20, "prayers");
        std::map<std::string, double> gate{{"responsible_handling", 0.1}};

        REQUIRE(ConfidenceEstimator::estimate(traumatic, video, gate) == Catch::Approx(0.2));
    }
}

TEST_CASE("Authenticity labels", "[authenticity]") {
    const auto& registry = ProfileRegistry::instance();

    SECTION("Heartwarming") {
        const auto& p = registry.profile("heartwarming");
        REQUIRE(AuthenticityClassifier::classify(p, 0.8) == "authentic");
        REQUIRE(AuthenticityClassifier::classify(p, 0.7) == "questionable");
        REQUIRE(AuthenticityClassifier::classify(p, 0.5) == "questionable");
        REQUIRE(AuthenticityClassifier::classify(p, 0.4) == "likely_staged");
    }

    SECTION("Motivational") {
        const auto& p = registry.profile("motivational");
        REQUIRE(AuthenticityClassifier::classify(p, 0.9) == "authentic");
        REQUIRE(AuthenticityClassifier::classify(p, 0.2) == "likely_fake");
    }

    SECTION("Traumatic") {
        const auto& p = registry.profile("traumatic");
        REQUIRE(AuthenticityClassifier::classify(p, 0.75) == "responsible");
        REQUIRE(AuthenticityClassifier::classify(p, 0.45) == "questionable");
        REQUIRE(AuthenticityClassifier::classify(p, 0.1) == "exploitative");
    }
}
