#pragma once

#include "category_profile.hpp"
#include "score_result.hpp"
#include "video.hpp"
#include <string>

class ReportFormatter {
public:
    ReportFormatter(size_t max_moments = 3, size_t comment_preview_chars = 100);

    std::string format(const VideoRecord& video,
                       const ScoreResult& result,
                       const CategoryProfile& profile) const;

    std::string format_json(const ScoreResult& result) const;

    // excellent >= 8, good >= 6, fair >= 4, else poor
    static std::string rating_band(double score);
    static std::string assessment(double final_score);

private:
    size_t max_moments_;
    size_t comment_preview_chars_;

    std::string build_header(const VideoRecord& video, const CategoryProfile& profile) const;
};
