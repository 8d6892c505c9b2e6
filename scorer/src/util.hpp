#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace util {
    std::string current_iso8601();
    std::string to_lower(const std::string& str);
    std::string trim(const std::string& str);
    // At most max_chars bytes, cut on a UTF-8 boundary, then "..."
    std::string truncate(const std::string& str, size_t max_chars);

    // Substring containment on already-lowercased text ("cry" hits "crying")
    bool contains(const std::string& haystack, const std::string& needle);
    int count_matches(const std::string& haystack, const std::vector<std::string>& keywords);
    std::vector<std::string> matched_keywords(const std::string& haystack,
                                              const std::vector<std::string>& keywords);

    double clamp01(double value);
}
