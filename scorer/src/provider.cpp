#include "provider.hpp"
#include "errors.hpp"
#include "serialization.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <fstream>

std::string provider_error_kind_to_string(ProviderErrorKind kind) {
    switch (kind) {
        case ProviderErrorKind::NotFound:
            return "not_found";
        case ProviderErrorKind::AuthError:
            return "auth_error";
        case ProviderErrorKind::RateLimited:
            return "rate_limited";
        case ProviderErrorKind::TransientError:
            return "transient_error";
    }
    return "transient_error";
}

FileVideoProvider::FileVideoProvider(const std::string& data_dir)
    : data_dir_(data_dir) {}

VideoRecord FileVideoProvider::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ProviderError(ProviderErrorKind::NotFound, "Video record not found: " + path);
    }

    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return Serializer::video_from_json(j);
    } catch (const std::exception& e) {
        throw ProviderError(ProviderErrorKind::TransientError,
                            fmt::format("Failed to read {}: {}", path, e.what()));
    }
}

VideoRecord FileVideoProvider::fetch(const std::string& video_id) {
    std::string path = data_dir_ + "/" + video_id + ".json";
    spdlog::debug("Loading video {} from {}", video_id, path);

    VideoRecord video = load_file(path);
    if (video.video_id.empty()) {
        video.video_id = video_id;
    }
    return video;
}

namespace {

// Larger components are treated as unparseable
constexpr int64_t kMaxDurationComponent = 1000000000;

bool is_id_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

} // namespace

std::optional<std::string> extract_video_id(const std::string& url_or_id) {
    static const char* const prefixes[] = {"youtube.com/watch?v=", "youtu.be/", "youtube.com/embed/"};

    for (const char* prefix : prefixes) {
        size_t pos = url_or_id.find(prefix);
        if (pos == std::string::npos) continue;

        size_t start = pos + std::char_traits<char>::length(prefix);
        size_t end = start;
        while (end < url_or_id.size() && is_id_char(url_or_id[end])) end++;
        if (end == start) return std::nullopt;
        return url_or_id.substr(start, end - start);
    }

    if (url_or_id.size() == 11) {
        for (char c : url_or_id) {
            if (!is_id_char(c)) return std::nullopt;
        }
        return url_or_id;
    }
    return std::nullopt;
}

int64_t parse_iso8601_duration(const std::string& duration) {
    if (duration.size() < 3 || duration.compare(0, 2, "PT") != 0) return 0;

    int64_t total = 0;
    int64_t value = 0;
    bool have_digits = false;
    for (size_t i = 2; i < duration.size(); i++) {
        char c = duration[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            if (value > kMaxDurationComponent / 10) return 0;
            value = value * 10 + (c - '0');
            have_digits = true;
            continue;
        }
        if (!have_digits) return 0;
        switch (c) {
            case 'H': total += value * 3600; break;
            case 'M': total += value * 60; break;
            case 'S': total += value; break;
            default: return 0;
        }
        value = 0;
        have_digits = false;
    }
    return have_digits ? 0 : total;
}

std::string format_duration(int64_t seconds) {
    if (seconds < 0) seconds = 0;
    int64_t hours = seconds / 3600;
    int64_t minutes = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}:{:02d}:{:02d}", hours, minutes, secs);
    }
    return fmt::format("{}:{:02d}", minutes, secs);
}
