#include "profile_registry.hpp"
#include "assessors.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace {
constexpr double kWeightTolerance = 1e-6;
}

ProfileRegistry::ProfileRegistry(std::vector<CategoryProfile> profiles) {
    for (auto& p : profiles) {
        validate(p);
        std::string id = p.id;
        if (!profiles_.emplace(id, std::move(p)).second) {
            throw ConfigurationError("Duplicate category profile: " + id);
        }
    }
    spdlog::info("Loaded {} category profiles", profiles_.size());
}

const ProfileRegistry& ProfileRegistry::instance() {
    static const ProfileRegistry registry(default_profiles());
    return registry;
}

const CategoryProfile& ProfileRegistry::profile(const std::string& id) const {
    auto it = profiles_.find(id);
    if (it == profiles_.end()) {
        throw InvalidCategory(id);
    }
    return it->second;
}

bool ProfileRegistry::contains(const std::string& id) const {
    return profiles_.count(id) > 0;
}

std::vector<std::string> ProfileRegistry::ids() const {
    std::vector<std::string> out;
    for (const auto& entry : profiles_) {
        out.push_back(entry.first);
    }
    return out;
}

void ProfileRegistry::validate(const CategoryProfile& profile) {
    if (profile.id.empty()) {
        throw ConfigurationError("Category profile without id");
    }
    if (profile.component_weights.empty()) {
        throw ConfigurationError(profile.id + ": no component weights");
    }

    double total = 0.0;
    for (const auto& entry : profile.component_weights) {
        if (!ComponentAssessors::has(entry.first)) {
            throw ConfigurationError(profile.id + ": no assessor for component '" + entry.first + "'");
        }
        if (entry.second < 0.0) {
            throw ConfigurationError(profile.id + ": negative weight for '" + entry.first + "'");
        }
        total += entry.second;
    }
    if (std::abs(total - 1.0) > kWeightTolerance) {
        throw ConfigurationError(profile.id + ": component weights sum to " + std::to_string(total));
    }

    if (profile.component_weights.count(profile.gating.component) == 0) {
        throw ConfigurationError(profile.id + ": gating component '" + profile.gating.component +
                                 "' is not weighted");
    }
    if (profile.gating.penalty < 0.0 || profile.gating.penalty > 1.0) {
        throw ConfigurationError(profile.id + ": gating penalty outside [0,1]");
    }
}
