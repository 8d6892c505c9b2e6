#include "history.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

nlohmann::json HistoryEntry::to_json() const {
    return {
        {"timestamp", timestamp},
        {"videoId", video_id},
        {"title", title},
        {"category", category},
        {"score", score},
        {"authenticity", authenticity}
    };
}

HistoryEntry HistoryEntry::from_json(const nlohmann::json& j) {
    HistoryEntry entry;
    entry.timestamp = j.at("timestamp").get<std::string>();
    entry.video_id = j.value("videoId", "");
    entry.title = j.value("title", "");
    entry.category = j.at("category").get<std::string>();
    entry.score = j.at("score").get<double>();
    entry.authenticity = j.value("authenticity", "");
    return entry;
}

HistoryLog::HistoryLog(const std::string& path) : path_(path) {}

void HistoryLog::append(const HistoryEntry& entry) {
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Cannot open history log: " + path_);
    }
    out << entry.to_json().dump() << "\n";
    spdlog::debug("Appended history entry for {} ({})", entry.video_id, entry.category);
}

std::vector<HistoryEntry> HistoryLog::recent(size_t limit) const {
    std::vector<HistoryEntry> entries;

    std::ifstream in(path_);
    if (!in) return entries;

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (line.empty()) continue;
        try {
            entries.push_back(HistoryEntry::from_json(nlohmann::json::parse(line)));
        } catch (const std::exception& e) {
            spdlog::warn("Skipping malformed history line {}: {}", line_no, e.what());
        }
    }

    std::vector<HistoryEntry> out;
    for (auto it = entries.rbegin(); it != entries.rend() && out.size() < limit; ++it) {
        out.push_back(*it);
    }
    return out;
}

void HistoryLog::clear() {
    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot truncate history log: " + path_);
    }
}
