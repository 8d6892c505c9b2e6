#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Service
    std::string service_name;
    std::string log_level;

    // Scoring
    std::string default_category;

    // Inputs
    std::string video_data_dir;

    // History (empty path disables it)
    std::string history_path;
    int history_display_limit;

    // Report
    std::string report_format;  // "text" or "json"
    int report_max_moments;
    int comment_preview_chars;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
