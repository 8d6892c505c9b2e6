#pragma once

#include "../src/video.hpp"
#include <string>
#include <vector>

inline VideoRecord make_video(const std::string& title,
                              const std::string& description = "",
                              const std::vector<std::string>& comments = {}) {
    VideoRecord video;
    video.video_id = "dQw4w9WgXcQ";
    video.title = title;
    video.description = description;
    video.comments = comments;
    return video;
}

inline Transcript make_transcript(const std::string& text) {
    Transcript t;
    t.available = true;
    t.text = text;
    return t;
}
