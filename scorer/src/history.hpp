#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct HistoryEntry {
    std::string timestamp;  // ISO-8601 UTC
    std::string video_id;
    std::string title;
    std::string category;
    double score;
    std::string authenticity;

    nlohmann::json to_json() const;
    static HistoryEntry from_json(const nlohmann::json& j);
};

// Append-only JSON-lines log of past results
class HistoryLog {
public:
    explicit HistoryLog(const std::string& path);

    void append(const HistoryEntry& entry);

    // Newest first; malformed lines are skipped
    std::vector<HistoryEntry> recent(size_t limit) const;

    void clear();

private:
    std::string path_;
};
