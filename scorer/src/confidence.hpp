#pragma once

#include "category_profile.hpp"
#include "video.hpp"
#include <map>
#include <string>

// How much evidence backed a score, independent of its value
class ConfidenceEstimator {
public:
    static double estimate(const CategoryProfile& profile,
                           const VideoRecord& video,
                           const std::map<std::string, double>& components);
};
