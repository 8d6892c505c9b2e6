#pragma once

#include "score_result.hpp"
#include <string>
#include <vector>
#include <map>
#include <cstdint>

using KeywordList = std::vector<std::string>;

struct EmotionTiers {
    KeywordList strong;    // relevance weight 3.0
    KeywordList moderate;  // 2.0
    KeywordList mild;      // 1.0
};

struct AuthenticitySignals {
    KeywordList genuine;
    KeywordList staged;  // staged or exploitative
};

// final *= penalty when component_scores[component] < threshold
struct GatingRule {
    std::string component;
    double threshold;
    double penalty;
};

// final += bonus when at least min_count moments reach min_relevance
struct MomentBonusRule {
    double min_relevance;
    int min_count;
    double bonus;
};

struct ConfidenceRule {
    double floor;

    int comment_threshold;
    double comment_increment;

    double transcript_increment;

    int64_t min_views;
    double views_increment;

    double gating_min;
    double gating_increment;

    int64_t min_subscribers;
    double subscribers_increment;
};

struct AuthenticityLabels {
    std::string high;    // gating value > 0.7
    std::string medium;  // > 0.4
    std::string low;
};

struct CategoryProfile {
    std::string id;
    std::string display_name;

    std::map<std::string, KeywordList> content_types;
    EmotionTiers viewer_emotions;
    AuthenticitySignals authenticity_signals;
    std::map<std::string, KeywordList> speech_patterns;

    // Named keyword sets used by category-specific assessors
    // ("framing", "responsible", "exploitative", "struggle", "achievement", "credibility")
    std::map<std::string, KeywordList> extra_signals;

    // Phrases that point at a moment in the video ("the part where")
    KeywordList context_phrases;

    std::map<std::string, double> component_weights;
    double base_score;
    double scale_factor;
    GatingRule gating;
    MomentBonusRule moment_bonus;
    ConfidenceRule confidence;
    AuthenticityLabels labels;

    double staged_penalty_cap;
    // Sentiment whose comment share feeds emotional_impact
    Sentiment emotional_polarity;

    const KeywordList& signal_set(const std::string& name) const;
    KeywordList all_content_keywords() const;
    KeywordList all_emotion_keywords() const;
};

std::vector<CategoryProfile> default_profiles();
