#include "timestamp_parser.hpp"
#include <spdlog/spdlog.h>
#include <cctype>

namespace {

bool is_run_char(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || c == ':';
}

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

std::optional<int> TimestampParser::parse(const std::string& candidate) {
    std::vector<std::string> groups;
    size_t start = 0;
    while (true) {
        size_t colon = candidate.find(':', start);
        groups.push_back(candidate.substr(start, colon == std::string::npos ? std::string::npos : colon - start));
        if (colon == std::string::npos) break;
        start = colon + 1;
    }

    if (groups.size() < 2 || groups.size() > 3) return std::nullopt;
    for (const auto& g : groups) {
        if (!all_digits(g)) return std::nullopt;
    }
    if (groups[0].size() > 2) return std::nullopt;
    for (size_t i = 1; i < groups.size(); i++) {
        if (groups[i].size() != 2) return std::nullopt;
        if (std::stoi(groups[i]) >= 60) return std::nullopt;
    }

    int total = 0;
    for (const auto& g : groups) {
        total = total * 60 + std::stoi(g);
    }
    return total;
}

std::vector<TimestampMatch> TimestampParser::find_all(const std::string& text) {
    std::vector<TimestampMatch> matches;

    size_t i = 0;
    while (i < text.size()) {
        if (!is_run_char(text[i])) {
            i++;
            continue;
        }

        size_t begin = i;
        while (i < text.size() && is_run_char(text[i])) i++;

        std::string run = text.substr(begin, i - begin);
        while (!run.empty() && run.back() == ':') run.pop_back();
        if (run.find(':') == std::string::npos) continue;

        auto seconds = parse(run);
        if (!seconds) {
            spdlog::debug("Skipping malformed timestamp '{}'", run);
            continue;
        }
        matches.push_back({run, begin, *seconds});
    }

    return matches;
}
