#pragma once

#include "video.hpp"
#include <cstdint>
#include <optional>
#include <string>

// Supplies fully populated video records; failures raise ProviderError
class VideoProvider {
public:
    virtual ~VideoProvider() = default;
    virtual VideoRecord fetch(const std::string& video_id) = 0;
};

// Reads <dir>/<video_id>.json
class FileVideoProvider : public VideoProvider {
public:
    explicit FileVideoProvider(const std::string& data_dir);

    VideoRecord fetch(const std::string& video_id) override;

    // Loads one record file directly
    static VideoRecord load_file(const std::string& path);

private:
    std::string data_dir_;
};

// watch?v=, youtu.be/ and embed/ URLs, or a bare 11-character id
std::optional<std::string> extract_video_id(const std::string& url_or_id);

// "PT1H2M3S" -> 3723; 0 when unparseable
int64_t parse_iso8601_duration(const std::string& duration);

// "1:02:03" with hours, else "2:03"
std::string format_duration(int64_t seconds);
