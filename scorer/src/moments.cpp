#include "moments.hpp"
#include "sentiment.hpp"
#include "timestamp_parser.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

double MomentExtractor::relevance(const std::string& lowered_comment, const CategoryProfile& profile) {
    double score = 0.0;

    for (const auto& entry : profile.content_types) {
        score += kContentTypeWeight * util::count_matches(lowered_comment, entry.second);
    }

    const auto& tiers = profile.viewer_emotions;
    score += kStrongEmotionWeight * util::count_matches(lowered_comment, tiers.strong);
    score += kModerateEmotionWeight * util::count_matches(lowered_comment, tiers.moderate);
    score += kMildEmotionWeight * util::count_matches(lowered_comment, tiers.mild);

    score += kContextPhraseWeight * util::count_matches(lowered_comment, profile.context_phrases);

    return score;
}

CategoryIndicators MomentExtractor::indicators(const std::string& lowered_comment,
                                               const CategoryProfile& profile) {
    CategoryIndicators ind;

    for (const auto& entry : profile.content_types) {
        if (util::count_matches(lowered_comment, entry.second) > 0) {
            ind.matched_content_types.push_back(entry.first);
        }
    }

    for (const auto& word : util::matched_keywords(lowered_comment, profile.all_emotion_keywords())) {
        if (ind.matched_emotion_words.size() >= kMaxEmotionWords) break;
        ind.matched_emotion_words.push_back(word);
    }

    // Genuine is checked first
    if (util::count_matches(lowered_comment, profile.authenticity_signals.genuine) > 0) {
        ind.authenticity_signal = AuthenticitySignal::Genuine;
    } else if (util::count_matches(lowered_comment, profile.authenticity_signals.staged) > 0) {
        ind.authenticity_signal = AuthenticitySignal::Questionable;
    } else {
        ind.authenticity_signal = AuthenticitySignal::Unknown;
    }

    return ind;
}

std::vector<Moment> MomentExtractor::extract(const std::vector<std::string>& comments,
                                             const CategoryProfile& profile) {
    std::vector<Moment> moments;

    for (const auto& comment : comments) {
        std::string lowered = util::to_lower(comment);

        auto stamps = TimestampParser::find_all(lowered);
        if (stamps.empty()) continue;

        double score = relevance(lowered, profile);
        if (score <= 0.0) continue;

        Sentiment sentiment = SentimentClassifier::classify(comment);
        CategoryIndicators ind = indicators(lowered, profile);

        for (const auto& stamp : stamps) {
            Moment m;
            m.timestamp_text = stamp.text;
            m.seconds = stamp.seconds;
            m.source_comment = comment;
            m.relevance_score = score;
            m.sentiment = sentiment;
            m.indicators = ind;
            moments.push_back(std::move(m));
        }
    }

    std::stable_sort(moments.begin(), moments.end(), [](const Moment& a, const Moment& b) {
        return a.relevance_score > b.relevance_score;
    });

    spdlog::debug("Extracted {} moments from {} comments", moments.size(), comments.size());
    return moments;
}

int MomentExtractor::count_strong(const std::vector<Moment>& moments, double min_relevance) {
    return static_cast<int>(std::count_if(moments.begin(), moments.end(), [&](const Moment& m) {
        return m.relevance_score >= min_relevance;
    }));
}
