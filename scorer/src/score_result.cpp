#include "score_result.hpp"

std::string sentiment_to_string(Sentiment sentiment) {
    switch (sentiment) {
        case Sentiment::Positive:
            return "positive";
        case Sentiment::Negative:
            return "negative";
        case Sentiment::Neutral:
            return "neutral";
    }
    return "neutral";
}

std::string authenticity_signal_to_string(AuthenticitySignal signal) {
    switch (signal) {
        case AuthenticitySignal::Genuine:
            return "genuine";
        case AuthenticitySignal::Questionable:
            return "questionable";
        case AuthenticitySignal::Unknown:
            return "unknown";
    }
    return "unknown";
}
