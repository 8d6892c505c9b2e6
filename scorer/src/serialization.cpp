#include "serialization.hpp"
#include "provider.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

int64_t Serializer::get_count(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return 0;

    const auto& v = j[key];
    // The Data API reports statistics as strings
    if (v.is_string()) {
        try {
            return std::max<int64_t>(0, std::stoll(v.get<std::string>()));
        } catch (const std::exception&) {
            spdlog::warn("Invalid count for {}: '{}'", key, v.get<std::string>());
            return 0;
        }
    }
    return std::max<int64_t>(0, v.get<int64_t>());
}

VideoRecord Serializer::video_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("title")) {
        throw std::runtime_error("Video record missing 'title'");
    }

    VideoRecord video;
    video.video_id = j.value("videoId", "");
    video.title = j.at("title").get<std::string>();
    video.description = j.value("description", "");
    video.tags = j.value("tags", std::vector<std::string>{});

    video.view_count = get_count(j, "viewCount");
    video.like_count = get_count(j, "likeCount");
    video.comment_count = get_count(j, "commentCount");

    if (j.contains("durationSeconds")) {
        video.duration_seconds = get_count(j, "durationSeconds");
    } else if (j.contains("duration") && j["duration"].is_string()) {
        video.duration_seconds = parse_iso8601_duration(j["duration"].get<std::string>());
    }

    video.published_at = j.value("publishedAt", "");
    video.channel_title = j.value("channelTitle", "");
    video.comments = j.value("comments", std::vector<std::string>{});

    if (j.contains("transcript") && j["transcript"].is_object()) {
        const auto& t = j["transcript"];
        Transcript transcript;
        transcript.available = t.value("available", true);
        transcript.text = t.value("text", "");
        if (t.contains("segments")) {
            for (const auto& s : t["segments"]) {
                TranscriptSegment seg;
                seg.start_seconds = s.value("start", 0.0);
                seg.duration_seconds = s.value("duration", 0.0);
                seg.text = s.value("text", "");
                transcript.segments.push_back(seg);
            }
        }
        video.transcript = transcript;
    }

    if (j.contains("thumbnail") && j["thumbnail"].is_object()) {
        const auto& t = j["thumbnail"];
        Thumbnail thumb;
        thumb.available = t.value("available", true);
        thumb.brightness = t.value("brightness", 0.0);
        thumb.contrast = t.value("contrast", 0.0);
        if (t.contains("colorProfile")) {
            const auto& cp = t["colorProfile"];
            thumb.color_profile.warm_tones = cp.value("warmTones", 0.0);
            thumb.color_profile.cold_tones = cp.value("coldTones", 0.0);
            thumb.color_profile.red_dominant = cp.value("redDominant", false);
        }
        video.thumbnail = thumb;
    }

    if (j.contains("channelInfo") && j["channelInfo"].is_object()) {
        const auto& c = j["channelInfo"];
        ChannelInfo channel;
        channel.subscriber_count = get_count(c, "subscriberCount");
        channel.video_count = get_count(c, "videoCount");
        channel.description = c.value("description", "");
        video.channel_info = channel;
    }

    return video;
}

nlohmann::json Serializer::to_json(const Moment& moment) {
    return {
        {"timestamp", moment.timestamp_text},
        {"seconds", moment.seconds},
        {"comment", moment.source_comment},
        {"relevance", moment.relevance_score},
        {"sentiment", sentiment_to_string(moment.sentiment)},
        {"indicators", {
            {"contentTypes", moment.indicators.matched_content_types},
            {"emotionWords", moment.indicators.matched_emotion_words},
            {"authenticity", authenticity_signal_to_string(moment.indicators.authenticity_signal)}
        }}
    };
}

nlohmann::json Serializer::to_json(const ScoreResult& result) {
    nlohmann::json j;
    j["category"] = result.category;
    j["finalScore"] = result.final_score;
    j["rawScore"] = result.raw_score;
    j["componentScores"] = result.component_scores;
    j["confidence"] = result.confidence;
    j["authenticityLabel"] = result.authenticity_label;
    j["gatingPenaltyApplied"] = result.gating_penalty_applied;
    j["momentBonusApplied"] = result.moment_bonus_applied;

    j["moments"] = nlohmann::json::array();
    for (const auto& m : result.moments) {
        j["moments"].push_back(to_json(m));
    }
    j["keyIndicators"] = result.key_indicators;
    return j;
}
