#pragma once

#include "category_profile.hpp"
#include <map>
#include <string>
#include <vector>

// Immutable table of category profiles, validated on construction.
class ProfileRegistry {
public:
    // Throws ConfigurationError on an inconsistent table
    explicit ProfileRegistry(std::vector<CategoryProfile> profiles);

    // Process-wide registry over default_profiles(), built on first use
    static const ProfileRegistry& instance();

    // Throws InvalidCategory for an unknown id
    const CategoryProfile& profile(const std::string& id) const;
    bool contains(const std::string& id) const;
    std::vector<std::string> ids() const;

private:
    std::map<std::string, CategoryProfile> profiles_;

    static void validate(const CategoryProfile& profile);
};
