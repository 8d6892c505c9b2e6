#pragma once

#include "category_profile.hpp"
#include "score_result.hpp"
#include <string>
#include <vector>

class MomentExtractor {
public:
    // Relevance weights
    static constexpr double kContentTypeWeight = 2.0;
    static constexpr double kStrongEmotionWeight = 3.0;
    static constexpr double kModerateEmotionWeight = 2.0;
    static constexpr double kMildEmotionWeight = 1.0;
    static constexpr double kContextPhraseWeight = 1.5;
    static constexpr size_t kMaxEmotionWords = 3;

    // One moment per timestamp in each relevant comment; sorted by relevance
    // descending, ties in comment order.
    static std::vector<Moment> extract(const std::vector<std::string>& comments,
                                       const CategoryProfile& profile);

    static double relevance(const std::string& lowered_comment, const CategoryProfile& profile);

    static CategoryIndicators indicators(const std::string& lowered_comment,
                                         const CategoryProfile& profile);

    static int count_strong(const std::vector<Moment>& moments, double min_relevance);
};
