#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

struct TranscriptSegment {
    double start_seconds = 0.0;
    double duration_seconds = 0.0;
    std::string text;
};

struct Transcript {
    bool available = false;
    std::string text;
    std::vector<TranscriptSegment> segments;
};

struct Thumbnail {
    bool available = false;
    double brightness = 0.0;  // mean luma, 0-255
    double contrast = 0.0;    // luma stddev, 0-128

    struct ColorProfile {
        double warm_tones = 0.0;  // pixel share, 0-1
        double cold_tones = 0.0;
        bool red_dominant = false;
    } color_profile;
};

struct ChannelInfo {
    int64_t subscriber_count = 0;
    int64_t video_count = 0;
    std::string description;
};

struct VideoRecord {
    std::string video_id;
    std::string title;
    std::string description;
    std::vector<std::string> tags;

    int64_t view_count = 0;
    int64_t like_count = 0;
    int64_t comment_count = 0;
    int64_t duration_seconds = 0;

    std::string published_at;
    std::string channel_title;

    // Retrieval order, not necessarily chronological
    std::vector<std::string> comments;

    std::optional<Transcript> transcript;
    std::optional<Thumbnail> thumbnail;
    std::optional<ChannelInfo> channel_info;

    bool has_transcript() const { return transcript.has_value() && transcript->available; }
    bool has_thumbnail() const { return thumbnail.has_value() && thumbnail->available; }
};
