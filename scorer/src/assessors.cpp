#include "assessors.hpp"
#include "moments.hpp"
#include "sentiment.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

const std::map<std::string, AssessorFn>& ComponentAssessors::table() {
    static const std::map<std::string, AssessorFn> assessors = {
        {"authenticity", &ComponentAssessors::authenticity},
        {"achievement_authenticity", &ComponentAssessors::achievement_authenticity},
        {"responsible_handling", &ComponentAssessors::responsible_handling},
        {"content_match", &ComponentAssessors::content_match},
        {"emotional_impact", &ComponentAssessors::emotional_impact},
        {"viewer_response", &ComponentAssessors::viewer_response},
        {"visual_warmth", &ComponentAssessors::visual_warmth},
        {"speech_patterns", &ComponentAssessors::speech_patterns},
        {"narrative_arc", &ComponentAssessors::narrative_arc},
        {"source_credibility", &ComponentAssessors::source_credibility}
    };
    return assessors;
}

bool ComponentAssessors::has(const std::string& component) {
    return table().count(component) > 0;
}

std::vector<std::string> ComponentAssessors::names() {
    std::vector<std::string> out;
    for (const auto& entry : table()) {
        out.push_back(entry.first);
    }
    return out;
}

double ComponentAssessors::assess(const std::string& component, const AssessmentInput& input) {
    return util::clamp01(table().at(component)(input));
}

std::map<std::string, double> ComponentAssessors::assess_all(const AssessmentInput& input) {
    std::map<std::string, double> scores;
    for (const auto& entry : input.profile.component_weights) {
        scores[entry.first] = assess(entry.first, input);
        spdlog::debug("  {} = {:.3f}", entry.first, scores[entry.first]);
    }
    return scores;
}

double ComponentAssessors::signal_balance(int genuine_hits, int staged_hits, double staged_cap) {
    double score = 0.5;
    score += std::min(0.15 * genuine_hits, 0.4);
    score -= std::min(0.2 * staged_hits, staged_cap);
    return util::clamp01(score);
}

double ComponentAssessors::authenticity(const AssessmentInput& input) {
    const auto& signals = input.profile.authenticity_signals;
    std::string text = input.corpus.combined();

    int genuine = util::count_matches(text, signals.genuine);
    int staged = util::count_matches(text, signals.staged);

    return signal_balance(genuine, staged, input.profile.staged_penalty_cap);
}

double ComponentAssessors::achievement_authenticity(const AssessmentInput& input) {
    const auto& signals = input.profile.authenticity_signals;
    std::string text = input.corpus.combined() + "\n" + input.corpus.transcript;

    int genuine = util::count_matches(text, signals.genuine);
    // Get-rich phrasing in the title counts twice
    int staged = util::count_matches(text, signals.staged) +
                 util::count_matches(input.corpus.title, signals.staged);

    return signal_balance(genuine, staged, input.profile.staged_penalty_cap);
}

double ComponentAssessors::responsible_handling(const AssessmentInput& input) {
    const auto& c = input.corpus;
    const auto& responsible = input.profile.signal_set("responsible");
    const auto& exploitative = input.profile.signal_set("exploitative");

    bool framed = util::count_matches(c.description, input.profile.signal_set("framing")) > 0;

    int responsible_hits = util::count_matches(c.description, responsible) +
                           util::count_matches(c.channel_desc, responsible) +
                           util::count_matches(c.transcript, responsible);
    int exploitative_hits = util::count_matches(c.title, exploitative) +
                            util::count_matches(c.description, exploitative) +
                            util::count_matches(c.tags, exploitative);

    double score = framed ? kFramedBase : kUnframedBase;
    score += std::min(kResponsibleStep * responsible_hits, kResponsibleCap);
    score -= std::min(0.2 * exploitative_hits, 0.4);
    return util::clamp01(score);
}

double ComponentAssessors::content_match(const AssessmentInput& input) {
    const auto& c = input.corpus;
    auto keywords = input.profile.all_content_keywords();

    int hits = util::count_matches(c.title, keywords) +
               util::count_matches(c.description, keywords) +
               util::count_matches(c.tags, keywords) +
               util::count_matches(c.comments, keywords);

    double score = 0.2;
    if (hits > 5) {
        score += 0.6;
    } else if (hits > 2) {
        score += 0.4;
    } else if (hits > 0) {
        score += 0.2;
    }
    return util::clamp01(score);
}

double ComponentAssessors::emotional_impact(const AssessmentInput& input) {
    const auto& comments = input.corpus.comment_list;
    auto emotions = input.profile.all_emotion_keywords();

    double score = 0.3;
    if (comments.empty()) return score;

    int polarity_count = 0;
    int density = 0;
    for (const auto& comment : comments) {
        if (SentimentClassifier::classify(comment) == input.profile.emotional_polarity) {
            polarity_count++;
        }
        density += util::count_matches(comment, emotions);
    }

    double ratio = static_cast<double>(polarity_count) / comments.size();
    score += ratio * 0.4;

    if (density > 5) {
        score += 0.3;
    } else if (density > 2) {
        score += 0.2;
    }
    return util::clamp01(score);
}

double ComponentAssessors::viewer_response(const AssessmentInput& input) {
    const auto& video = input.video;
    double score = 0.3;

    int strong = MomentExtractor::count_strong(input.moments, kStrongMomentRelevance);
    if (strong >= 3) {
        score += 0.5;
    } else if (strong >= 1) {
        score += 0.3;
    }

    if (video.comment_count > 1000) {
        score += 0.1;
    } else if (video.comment_count > 100) {
        score += 0.05;
    }

    // Like ratio only when there are views to divide by
    if (video.view_count > 0) {
        double like_ratio = static_cast<double>(video.like_count) / video.view_count;
        if (like_ratio > 0.03) {
            score += 0.1;
        } else if (like_ratio > 0.015) {
            score += 0.05;
        }
    }
    return util::clamp01(score);
}

double ComponentAssessors::visual_warmth(const AssessmentInput& input) {
    if (!input.video.has_thumbnail()) return kNoThumbnailDefault;

    const auto& thumb = *input.video.thumbnail;
    double score = 0.3;

    if (thumb.color_profile.warm_tones > thumb.color_profile.cold_tones) {
        score += 0.25;
    }
    if (thumb.color_profile.red_dominant) {
        score += 0.1;
    }
    if (thumb.brightness >= 120.0) {
        score += 0.2;
    } else if (thumb.brightness >= 90.0) {
        score += 0.1;
    }
    if (thumb.contrast >= 20.0 && thumb.contrast <= 70.0) {
        score += 0.1;
    }
    return util::clamp01(score);
}

double ComponentAssessors::speech_patterns(const AssessmentInput& input) {
    if (!input.video.has_transcript()) return kNoTranscriptDefault;

    int hits = 0;
    for (const auto& entry : input.profile.speech_patterns) {
        hits += util::count_matches(input.corpus.transcript, entry.second);
    }

    double score = 0.3;
    if (hits > 5) {
        score += 0.5;
    } else if (hits > 2) {
        score += 0.3;
    } else if (hits > 0) {
        score += 0.15;
    }
    return util::clamp01(score);
}

double ComponentAssessors::narrative_arc(const AssessmentInput& input) {
    std::string text = input.corpus.combined() + "\n" + input.corpus.transcript;

    bool struggle = util::count_matches(text, input.profile.signal_set("struggle")) > 0;
    bool achievement = util::count_matches(text, input.profile.signal_set("achievement")) > 0;

    double score = 0.2;
    if (struggle) score += 0.25;
    if (achievement) score += 0.25;
    // A full struggle-to-achievement arc
    if (struggle && achievement) score += 0.2;
    return util::clamp01(score);
}

double ComponentAssessors::source_credibility(const AssessmentInput& input) {
    if (!input.video.channel_info) return kNoChannelDefault;

    const auto& channel = *input.video.channel_info;
    double score = 0.3;

    if (channel.subscriber_count >= 1000000) {
        score += 0.4;
    } else if (channel.subscriber_count >= 100000) {
        score += 0.3;
    } else if (channel.subscriber_count >= 10000) {
        score += 0.15;
    }

    if (channel.video_count >= 100) {
        score += 0.1;
    }

    const auto& credibility = input.profile.signal_set("credibility");
    std::string channel_text = util::to_lower(input.video.channel_title) + "\n" + input.corpus.channel_desc;
    if (util::count_matches(channel_text, credibility) > 0) {
        score += 0.2;
    }
    return util::clamp01(score);
}
