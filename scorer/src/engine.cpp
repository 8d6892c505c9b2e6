#include "engine.hpp"
#include "aggregator.hpp"
#include "assessors.hpp"
#include "authenticity.hpp"
#include "confidence.hpp"
#include "corpus.hpp"
#include "moments.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

std::vector<std::string> build_key_indicators(const CategoryProfile& profile,
                                              const VideoRecord& video,
                                              const TextCorpus& corpus,
                                              const ScoreResult& result,
                                              const AggregateResult& agg) {
    std::vector<std::string> out;

    if (agg.gating_applied) {
        out.push_back(fmt::format("{} {:.2f} below {:.2f}: score x{:.1f}",
                                  profile.gating.component,
                                  result.component_scores.at(profile.gating.component),
                                  profile.gating.threshold, profile.gating.penalty));
    }
    if (agg.bonus_applied) {
        out.push_back(fmt::format("{} strong moments: +{:.1f}", agg.strong_moments, profile.moment_bonus.bonus));
    }

    std::string text = corpus.combined();
    std::vector<std::string> types;
    for (const auto& entry : profile.content_types) {
        if (util::count_matches(text, entry.second) > 0) types.push_back(entry.first);
    }
    if (!types.empty()) {
        out.push_back("Content types: " + join(types, ", "));
    }

    if (!result.moments.empty()) {
        const auto& top = result.moments.front();
        out.push_back(fmt::format("Top moment at {} (relevance {:.1f})", top.timestamp_text, top.relevance_score));
    }

    int genuine = util::count_matches(text, profile.authenticity_signals.genuine);
    int staged = util::count_matches(text, profile.authenticity_signals.staged);
    if (genuine > 0 || staged > 0) {
        out.push_back(fmt::format("Authenticity signals: {} genuine, {} staged", genuine, staged));
    }

    std::vector<std::string> missing;
    if (video.comments.empty()) missing.push_back("comments");
    if (!video.has_transcript()) missing.push_back("transcript");
    if (!video.has_thumbnail()) missing.push_back("thumbnail");
    if (!video.channel_info) missing.push_back("channel info");
    if (!missing.empty()) {
        out.push_back("Missing inputs: " + join(missing, ", "));
    }

    if (out.size() > ScoringEngine::kMaxKeyIndicators) {
        out.resize(ScoringEngine::kMaxKeyIndicators);
    }
    return out;
}

} // namespace

ScoringEngine::ScoringEngine(const ProfileRegistry& registry)
    : registry_(registry) {}

ScoreResult ScoringEngine::score(const VideoRecord& video, const std::string& category_id) const {
    const CategoryProfile& profile = registry_.profile(category_id);

    TextCorpus corpus = CorpusBuilder::build(video);
    std::vector<Moment> moments = MomentExtractor::extract(video.comments, profile);

    AssessmentInput input{video, corpus, profile, moments};

    ScoreResult result;
    result.category = profile.id;
    result.component_scores = ComponentAssessors::assess_all(input);

    AggregateResult agg = ScoreAggregator::aggregate(profile, result.component_scores, moments);
    result.final_score = agg.final_score;
    result.raw_score = agg.raw_score;
    result.gating_penalty_applied = agg.gating_applied;
    result.moment_bonus_applied = agg.bonus_applied;

    result.confidence = ConfidenceEstimator::estimate(profile, video, result.component_scores);
    result.authenticity_label = AuthenticityClassifier::classify(
        profile, result.component_scores.at(profile.gating.component));

    result.moments = std::move(moments);
    result.key_indicators = build_key_indicators(profile, video, corpus, result, agg);

    spdlog::info("Scored '{}' as {}: {:.1f}/10 (confidence {:.2f}, {})",
                 video.title, profile.id, result.final_score, result.confidence, result.authenticity_label);
    return result;
}
