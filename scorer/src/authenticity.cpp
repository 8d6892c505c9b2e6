#include "authenticity.hpp"

std::string AuthenticityClassifier::classify(const CategoryProfile& profile, double gating_value) {
    if (gating_value > kHighThreshold) return profile.labels.high;
    if (gating_value > kMediumThreshold) return profile.labels.medium;
    return profile.labels.low;
}
