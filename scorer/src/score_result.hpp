#pragma once

#include <string>
#include <vector>
#include <map>

enum class Sentiment {
    Positive,
    Negative,
    Neutral
};

enum class AuthenticitySignal {
    Genuine,
    Questionable,
    Unknown
};

std::string sentiment_to_string(Sentiment sentiment);
std::string authenticity_signal_to_string(AuthenticitySignal signal);

struct CategoryIndicators {
    std::vector<std::string> matched_content_types;
    std::vector<std::string> matched_emotion_words;  // at most 3
    AuthenticitySignal authenticity_signal = AuthenticitySignal::Unknown;
};

struct Moment {
    std::string timestamp_text;  // "2:15" or "1:02:15"
    int seconds = 0;
    std::string source_comment;
    double relevance_score = 0.0;
    Sentiment sentiment = Sentiment::Neutral;
    CategoryIndicators indicators;
};

struct ScoreResult {
    std::string category;
    double final_score = 0.0;   // [0, 10]
    double raw_score = 0.0;     // base + scaled weighted sum, before gating/bonus/clamp
    std::map<std::string, double> component_scores;
    double confidence = 0.0;    // [0, 1]
    std::string authenticity_label;

    bool gating_penalty_applied = false;
    bool moment_bonus_applied = false;

    std::vector<Moment> moments;              // relevance descending, stable
    std::vector<std::string> key_indicators;  // at most 6
};
