#pragma once

#include "category_profile.hpp"
#include "score_result.hpp"
#include <map>
#include <string>
#include <vector>

struct AggregateResult {
    double weighted_sum;     // sum(weight_i * clamp01(component_i))
    double raw_score;        // base + scale * weighted_sum
    double final_score;      // after gating, bonus and clamp to [0,10]

    bool gating_applied;
    bool bonus_applied;
    int strong_moments;
};

// Profile-driven combination: weighted sum -> gating penalty -> moment bonus -> clamp
class ScoreAggregator {
public:
    static constexpr double kMinScore = 0.0;
    static constexpr double kMaxScore = 10.0;

    static AggregateResult aggregate(const CategoryProfile& profile,
                                     const std::map<std::string, double>& components,
                                     const std::vector<Moment>& moments);
};
