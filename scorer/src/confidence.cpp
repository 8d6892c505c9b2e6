#include "confidence.hpp"
#include "util.hpp"

double ConfidenceEstimator::estimate(const CategoryProfile& profile,
                                     const VideoRecord& video,
                                     const std::map<std::string, double>& components) {
    const auto& rule = profile.confidence;
    double confidence = rule.floor;

    if (static_cast<int64_t>(video.comments.size()) > rule.comment_threshold) {
        confidence += rule.comment_increment;
    }
    if (video.has_transcript()) {
        confidence += rule.transcript_increment;
    }
    if (video.view_count > rule.min_views) {
        confidence += rule.views_increment;
    }

    auto gate = components.find(profile.gating.component);
    if (gate != components.end() && gate->second > rule.gating_min) {
        confidence += rule.gating_increment;
    }

    if (video.channel_info && video.channel_info->subscriber_count > rule.min_subscribers) {
        confidence += rule.subscribers_increment;
    }

    return util::clamp01(confidence);
}
