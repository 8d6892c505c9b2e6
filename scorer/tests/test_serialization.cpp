#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/serialization.hpp"

TEST_CASE("Video record from JSON", "[serialization]") {
    SECTION("Full record") {
        nlohmann::json raw = {
            {"videoId", "abc123def45"},
            {"title", "Surprise Reunion"},
            {"description", "A soldier comes home"},
            {"tags", {"reunion", "military"}},
            {"viewCount", "150000"},
            {"likeCount", 4200},
            {"commentCount", "310"},
            {"duration", "PT3M25S"},
            {"publishedAt", "2024-05-01T12:00:00Z"},
            {"channelTitle", "Good News Daily"},
            {"comments", {"the reunion at 2:15 made me cry", "so sweet"}},
            {"transcript", {
                {"available", true},
                {"text", "welcome home"},
                {"segments", {{{"start", 0.0}, {"duration", 1.5}, {"text", "welcome home"}}}}
            }},
            {"thumbnail", {
                {"brightness", 140.0},
                {"contrast", 35.0},
                {"colorProfile", {{"warmTones", 0.6}, {"coldTones", 0.1}, {"redDominant", true}}}
            }},
            {"channelInfo", {{"subscriberCount", "1200000"}, {"videoCount", 800}, {"description", "daily news"}}}
        };

        auto video = Serializer::video_from_json(raw);

        REQUIRE(video.video_id == "abc123def45");
        REQUIRE(video.title == "Surprise Reunion");
        REQUIRE(video.tags.size() == 2);
        REQUIRE(video.view_count == 150000);
        REQUIRE(video.like_count == 4200);
        REQUIRE(video.comment_count == 310);
        REQUIRE(video.duration_seconds == 205);
        REQUIRE(video.comments.size() == 2);

        REQUIRE(video.has_transcript());
        REQUIRE(video.transcript->segments.size() == 1);
        REQUIRE(video.transcript->segments[0].duration_seconds == Catch::Approx(1.5));

        REQUIRE(video.has_thumbnail());
        REQUIRE(video.thumbnail->color_profile.red_dominant);
        REQUIRE(video.thumbnail->color_profile.warm_tones == Catch::Approx(0.6));

        REQUIRE(video.channel_info.has_value());
        REQUIRE(video.channel_info->subscriber_count == 1200000);
        REQUIRE(video.channel_info->video_count == 800);
    }

    SECTION("Only a title is required") {
        auto video = Serializer::video_from_json({{"title", "minimal"}});

        REQUIRE(video.title == "minimal");
        REQUIRE(video.comments.empty());
        REQUIRE(video.view_count == 0);
        REQUIRE_FALSE(video.transcript.has_value());
        REQUIRE_FALSE(video.thumbnail.has_value());
        REQUIRE_FALSE(video.channel_info.has_value());
    }

    SECTION("Explicit duration and bad counts") {
        auto video = Serializer::video_from_json({{"title", "t"}, {"durationSeconds", 75}, {"viewCount", "lots"}});
        REQUIRE(video.duration_seconds == 75);
        REQUIRE(video.view_count == 0);
    }

    SECTION("Missing title") {
        REQUIRE_THROWS_AS(Serializer::video_from_json({{"description", "no title"}}), std::runtime_error);
        REQUIRE_THROWS_AS(Serializer::video_from_json(nlohmann::json::array()), std::runtime_error);
    }
}

TEST_CASE("Score result to JSON", "[serialization]") {
    ScoreResult result;
    result.category = "heartwarming";
    result.final_score = 7.5;
    result.raw_score = 6.7;
    result.component_scores = {{"authenticity", 0.8}, {"emotional_impact", 0.6}};
    result.confidence = 0.85;
    result.authenticity_label = "authentic";
    result.moment_bonus_applied = true;
    result.key_indicators = {"Content types: reunions"};

    Moment m;
    m.timestamp_text = "2:15";
    m.seconds = 135;
    m.source_comment = "the reunion at 2:15";
    m.relevance_score = 7.5;
    m.sentiment = Sentiment::Positive;
    m.indicators.matched_content_types = {"reunions"};
    m.indicators.authenticity_signal = AuthenticitySignal::Genuine;
    result.moments.push_back(m);

    auto j = Serializer::to_json(result);

    REQUIRE(j["category"] == "heartwarming");
    REQUIRE(j["finalScore"].get<double>() == Catch::Approx(7.5));
    REQUIRE(j["componentScores"]["authenticity"].get<double>() == Catch::Approx(0.8));
    REQUIRE(j["authenticityLabel"] == "authentic");
    REQUIRE(j["gatingPenaltyApplied"] == false);
    REQUIRE(j["momentBonusApplied"] == true);
    REQUIRE(j["moments"].size() == 1);
    REQUIRE(j["moments"][0]["timestamp"] == "2:15");
    REQUIRE(j["moments"][0]["seconds"] == 135);
    REQUIRE(j["moments"][0]["sentiment"] == "positive");
    REQUIRE(j["moments"][0]["indicators"]["contentTypes"][0] == "reunions");
    REQUIRE(j["moments"][0]["indicators"]["authenticity"] == "genuine");
    REQUIRE(j["keyIndicators"].size() == 1);
}
