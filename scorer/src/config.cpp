#include "config.hpp"
#include "profile_registry.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.service_name = get_env("SERVICE_NAME", "clipscout");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    cfg.default_category = get_env("DEFAULT_CATEGORY", "heartwarming");
    cfg.video_data_dir = get_env("VIDEO_DATA_DIR", "./videos");

    cfg.history_path = get_env("HISTORY_PATH");
    cfg.history_display_limit = get_env_int("HISTORY_DISPLAY_LIMIT", 5);

    cfg.report_format = get_env("REPORT_FORMAT", "text");
    cfg.report_max_moments = get_env_int("REPORT_MAX_MOMENTS", 3);
    cfg.comment_preview_chars = get_env_int("COMMENT_PREVIEW_CHARS", 100);

    return cfg;
}

void Config::validate() const {
    if (!ProfileRegistry::instance().contains(default_category)) {
        throw std::runtime_error("DEFAULT_CATEGORY is not a known category: " + default_category);
    }
    if (report_format != "text" && report_format != "json") {
        throw std::runtime_error("REPORT_FORMAT must be 'text' or 'json'");
    }
    if (history_display_limit <= 0) {
        throw std::runtime_error("HISTORY_DISPLAY_LIMIT must be positive");
    }
    if (report_max_moments <= 0 || comment_preview_chars <= 0) {
        throw std::runtime_error("REPORT_MAX_MOMENTS and COMMENT_PREVIEW_CHARS must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Default category: {}", default_category);
    spdlog::info("  Video data dir: {}", video_data_dir);
    spdlog::info("  History: {}", history_path.empty() ? "disabled" : history_path);
}
