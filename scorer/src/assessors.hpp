#pragma once

#include "category_profile.hpp"
#include "corpus.hpp"
#include "score_result.hpp"
#include "video.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

struct AssessmentInput {
    const VideoRecord& video;
    const TextCorpus& corpus;
    const CategoryProfile& profile;
    const std::vector<Moment>& moments;
};

using AssessorFn = std::function<double(const AssessmentInput&)>;

// Heuristic component scores in [0,1]. Each assessor is a pure function of
// its input and falls back to a fixed neutral value when the optional data
// it reads (transcript, thumbnail, channel) is missing.
class ComponentAssessors {
public:
    static constexpr double kNoThumbnailDefault = 0.5;
    static constexpr double kNoTranscriptDefault = 0.4;
    static constexpr double kNoChannelDefault = 0.4;
    static constexpr double kStrongMomentRelevance = 5.0;

    // Responsible handling: only framing terms in the description reach the
    // gate; other responsible wording tops out below it.
    static constexpr double kFramedBase = 0.7;
    static constexpr double kUnframedBase = 0.3;
    static constexpr double kResponsibleStep = 0.05;
    static constexpr double kResponsibleCap = 0.15;

    static bool has(const std::string& component);
    static std::vector<std::string> names();

    // Clamped value of one component; throws std::out_of_range for unknown names
    static double assess(const std::string& component, const AssessmentInput& input);

    // Every component weighted by the input's profile
    static std::map<std::string, double> assess_all(const AssessmentInput& input);

    static double authenticity(const AssessmentInput& input);
    static double achievement_authenticity(const AssessmentInput& input);
    static double responsible_handling(const AssessmentInput& input);
    static double content_match(const AssessmentInput& input);
    static double emotional_impact(const AssessmentInput& input);
    static double viewer_response(const AssessmentInput& input);
    static double visual_warmth(const AssessmentInput& input);
    static double speech_patterns(const AssessmentInput& input);
    static double narrative_arc(const AssessmentInput& input);
    static double source_credibility(const AssessmentInput& input);

private:
    static const std::map<std::string, AssessorFn>& table();

    // base 0.5, +min(0.15*genuine, 0.4), -min(0.2*staged, cap)
    static double signal_balance(int genuine_hits, int staged_hits, double staged_cap);
};
