#include "report.hpp"
#include "provider.hpp"
#include "serialization.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <algorithm>

ReportFormatter::ReportFormatter(size_t max_moments, size_t comment_preview_chars)
    : max_moments_(max_moments), comment_preview_chars_(comment_preview_chars) {}

std::string ReportFormatter::rating_band(double score) {
    if (score >= 8.0) return "excellent";
    if (score >= 6.0) return "good";
    if (score >= 4.0) return "fair";
    return "poor";
}

std::string ReportFormatter::assessment(double final_score) {
    if (final_score >= 8.5) return "Excellent - outstanding example of the category";
    if (final_score >= 7.0) return "Good - strong category match";
    if (final_score >= 5.5) return "Moderate - some category elements present";
    return "Poor - does not fit the category";
}

std::string ReportFormatter::build_header(const VideoRecord& video, const CategoryProfile& profile) const {
    std::string msg = fmt::format("== {} ==\n", profile.display_name);
    msg += fmt::format("{}\n", video.title);
    if (!video.channel_title.empty()) {
        msg += fmt::format("Channel: {}\n", video.channel_title);
    }
    msg += fmt::format("Duration: {} | Views: {} | Likes: {} | Comments: {}\n",
                       format_duration(video.duration_seconds),
                       video.view_count, video.like_count, video.comment_count);
    return msg;
}

std::string ReportFormatter::format(const VideoRecord& video,
                                    const ScoreResult& result,
                                    const CategoryProfile& profile) const {
    std::string msg = build_header(video, profile);
    msg += "\n";

    msg += fmt::format("Score: {:.1f}/10 ({})\n", result.final_score, rating_band(result.final_score));
    msg += fmt::format("Confidence: {:.0f}%\n", result.confidence * 100.0);
    msg += fmt::format("Authenticity: {}\n", result.authenticity_label);

    msg += "\nComponents:\n";
    for (const auto& entry : result.component_scores) {
        double out_of_ten = entry.second * 10.0;
        msg += fmt::format("  {:<26} {:>4.1f}/10 ({})\n", entry.first, out_of_ten, rating_band(out_of_ten));
    }

    if (!result.moments.empty()) {
        msg += "\nKey moments:\n";
        size_t shown = std::min(max_moments_, result.moments.size());
        for (size_t i = 0; i < shown; i++) {
            const auto& m = result.moments[i];
            msg += fmt::format("  [{}] {} ({:.1f})\n", m.timestamp_text,
                               util::truncate(m.source_comment, comment_preview_chars_),
                               m.relevance_score);
        }
    }

    if (!result.key_indicators.empty()) {
        msg += "\nIndicators:\n";
        for (const auto& line : result.key_indicators) {
            msg += "  - " + line + "\n";
        }
    }

    msg += "\nAssessment: " + assessment(result.final_score) + "\n";
    return msg;
}

std::string ReportFormatter::format_json(const ScoreResult& result) const {
    return Serializer::to_json(result).dump(2);
}
