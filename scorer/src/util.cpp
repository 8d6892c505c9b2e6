#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) start++;

    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) end--;

    return std::string(start, end);
}

std::string truncate(const std::string& str, size_t max_chars) {
    if (str.length() <= max_chars) return str;

    // Never split a UTF-8 sequence: back up past continuation bytes
    size_t cut = max_chars;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) cut--;
    return str.substr(0, cut) + "...";
}

bool contains(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;
    return haystack.find(needle) != std::string::npos;
}

int count_matches(const std::string& haystack, const std::vector<std::string>& keywords) {
    int hits = 0;
    for (const auto& kw : keywords) {
        if (contains(haystack, kw)) hits++;
    }
    return hits;
}

std::vector<std::string> matched_keywords(const std::string& haystack,
                                          const std::vector<std::string>& keywords) {
    std::vector<std::string> out;
    for (const auto& kw : keywords) {
        if (contains(haystack, kw)) out.push_back(kw);
    }
    return out;
}

double clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

} // namespace util
