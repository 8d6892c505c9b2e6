#include "sentiment.hpp"
#include "util.hpp"
#include <vector>

namespace {

const std::vector<std::string> kStrongPositive = {
    "love", "amazing", "incredible", "awesome", "perfect", "best", "beautiful"
};
const std::vector<std::string> kPositive = {
    "great", "good", "nice", "sweet", "inspiring", "touching", "wholesome", "happy", "tears", "crying"
};
const std::vector<std::string> kStrongNegative = {
    "hate", "terrible", "awful", "disgusting", "worst"
};
const std::vector<std::string> kNegative = {
    "bad", "fake", "staged", "boring", "cringe", "annoying", "scripted"
};

} // namespace

int SentimentClassifier::positive_total(const std::string& lowered) {
    return 2 * util::count_matches(lowered, kStrongPositive) + util::count_matches(lowered, kPositive);
}

int SentimentClassifier::negative_total(const std::string& lowered) {
    return 2 * util::count_matches(lowered, kStrongNegative) + util::count_matches(lowered, kNegative);
}

Sentiment SentimentClassifier::classify(const std::string& comment_text) {
    std::string lowered = util::to_lower(comment_text);
    int pos = positive_total(lowered);
    int neg = negative_total(lowered);

    if (pos > neg) return Sentiment::Positive;
    if (neg > pos) return Sentiment::Negative;
    return Sentiment::Neutral;
}
