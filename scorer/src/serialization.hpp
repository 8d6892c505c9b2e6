#pragma once

#include "score_result.hpp"
#include "video.hpp"
#include <nlohmann/json.hpp>

class Serializer {
public:
    // Requires "title"; every other field is optional
    static VideoRecord video_from_json(const nlohmann::json& j);

    static nlohmann::json to_json(const Moment& moment);
    static nlohmann::json to_json(const ScoreResult& result);

private:
    static int64_t get_count(const nlohmann::json& j, const char* key);
};
