#include "aggregator.hpp"
#include "moments.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

AggregateResult ScoreAggregator::aggregate(const CategoryProfile& profile,
                                           const std::map<std::string, double>& components,
                                           const std::vector<Moment>& moments) {
    AggregateResult result;

    result.weighted_sum = 0.0;
    for (const auto& entry : profile.component_weights) {
        result.weighted_sum += entry.second * util::clamp01(components.at(entry.first));
    }
    result.raw_score = profile.base_score + profile.scale_factor * result.weighted_sum;

    double final_score = result.raw_score;

    const auto& gate = profile.gating;
    result.gating_applied = util::clamp01(components.at(gate.component)) < gate.threshold;
    if (result.gating_applied) {
        final_score *= gate.penalty;
        spdlog::debug("Gating penalty: {} < {:.2f}, x{:.2f}", gate.component, gate.threshold, gate.penalty);
    }

    const auto& bonus = profile.moment_bonus;
    result.strong_moments = MomentExtractor::count_strong(moments, bonus.min_relevance);
    result.bonus_applied = result.strong_moments >= bonus.min_count;
    if (result.bonus_applied) {
        final_score += bonus.bonus;
        spdlog::debug("Moment bonus: {} strong moments, +{:.1f}", result.strong_moments, bonus.bonus);
    }

    result.final_score = std::max(kMinScore, std::min(kMaxScore, final_score));
    return result;
}
