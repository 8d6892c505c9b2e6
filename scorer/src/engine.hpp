#pragma once

#include "profile_registry.hpp"
#include "score_result.hpp"
#include "video.hpp"
#include <string>
#include <vector>

// Stateless scoring entry point. Safe to share across threads: every call
// only reads the registry.
class ScoringEngine {
public:
    static constexpr size_t kMaxKeyIndicators = 6;

    explicit ScoringEngine(const ProfileRegistry& registry = ProfileRegistry::instance());

    // Throws InvalidCategory before any computation
    ScoreResult score(const VideoRecord& video, const std::string& category_id) const;

    const ProfileRegistry& registry() const { return registry_; }

private:
    const ProfileRegistry& registry_;
};
