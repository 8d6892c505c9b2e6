#pragma once

#include "category_profile.hpp"
#include <string>

// Gating value -> category label: > 0.7 high, > 0.4 medium, else low
class AuthenticityClassifier {
public:
    static constexpr double kHighThreshold = 0.7;
    static constexpr double kMediumThreshold = 0.4;

    static std::string classify(const CategoryProfile& profile, double gating_value);
};
