#pragma once

#include "score_result.hpp"
#include <string>

class SentimentClassifier {
public:
    // Strong keywords count 2, ordinary ones 1; ties are neutral.
    // Case-insensitive substring containment, not tokenized.
    static Sentiment classify(const std::string& comment_text);

    static int positive_total(const std::string& lowered);
    static int negative_total(const std::string& lowered);
};
