#include "cli.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "history.hpp"
#include "profile_registry.hpp"
#include "provider.hpp"
#include "report.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace {

void setup_logging(const std::string& log_level) {
    // Reports go to stdout, logs to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("clipscout", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::debug("Logging initialized at level: {}", log_level);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

VideoRecord resolve_video(const std::string& ref, VideoProvider& provider) {
    if (ends_with(ref, ".json")) {
        return FileVideoProvider::load_file(ref);
    }
    auto video_id = extract_video_id(ref);
    if (!video_id) {
        throw ProviderError(ProviderErrorKind::NotFound, "Not a video URL, id or record file: " + ref);
    }
    return provider.fetch(*video_id);
}

void print_history(const HistoryLog& history, int limit) {
    auto entries = history.recent(static_cast<size_t>(limit));
    if (entries.empty()) {
        std::cout << "No analysis history\n";
        return;
    }
    std::cout << "Recent analyses:\n";
    for (const auto& e : entries) {
        std::cout << "  " << e.timestamp.substr(0, 10) << "  " << e.category << "  "
                  << util::truncate(e.title, 40) << "  " << e.score << "  " << e.authenticity << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    Config config;
    CliOptions opts;
    try {
        config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();

        opts = CliParser::parse(std::vector<std::string>(argv + 1, argv + argc), config.default_category);
        if (!opts.is_valid()) {
            std::cerr << *opts.error << "\n" << CliParser::usage(argv[0]);
            return 2;
        }
        // Fail fast on an unknown category before touching any video
        ProfileRegistry::instance().profile(opts.category);
    } catch (const InvalidCategory& e) {
        std::string known;
        for (const auto& id : ProfileRegistry::instance().ids()) {
            known += (known.empty() ? "" : ", ") + id;
        }
        spdlog::error("{} (known: {})", e.what(), known);
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 2;
    }

    ScoringEngine engine;
    const CategoryProfile& profile = engine.registry().profile(opts.category);
    FileVideoProvider provider(config.video_data_dir);
    ReportFormatter formatter(static_cast<size_t>(config.report_max_moments),
                              static_cast<size_t>(config.comment_preview_chars));
    bool json = opts.json_output || config.report_format == "json";

    bool failed = false;

    if (opts.clear_history) {
        if (config.history_path.empty()) {
            spdlog::warn("--clear-history given but HISTORY_PATH is not set");
        } else {
            try {
                HistoryLog(config.history_path).clear();
                spdlog::info("Cleared history at {}", config.history_path);
            } catch (const std::exception& e) {
                spdlog::error("Failed to clear history: {}", e.what());
                failed = true;
            }
        }
    }

    for (const auto& ref : opts.refs) {
        // One bad item must not stop the batch
        try {
            VideoRecord video = resolve_video(ref, provider);
            ScoreResult result = engine.score(video, opts.category);

            std::cout << (json ? formatter.format_json(result) : formatter.format(video, result, profile)) << "\n";

            if (opts.save_history && !config.history_path.empty()) {
                HistoryLog history(config.history_path);
                history.append({util::current_iso8601(), video.video_id, video.title,
                                result.category, result.final_score, result.authenticity_label});
            }
        } catch (const ProviderError& e) {
            spdlog::error("Failed to load {} ({}): {}", ref, provider_error_kind_to_string(e.kind()), e.what());
            failed = true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to score {}: {}", ref, e.what());
            failed = true;
        }
    }

    if (opts.save_history && config.history_path.empty()) {
        spdlog::warn("--save given but HISTORY_PATH is not set");
    }

    if (opts.show_history) {
        if (config.history_path.empty()) {
            spdlog::warn("History is disabled (HISTORY_PATH not set)");
        } else {
            try {
                print_history(HistoryLog(config.history_path), config.history_display_limit);
            } catch (const std::exception& e) {
                spdlog::error("Failed to read history: {}", e.what());
                failed = true;
            }
        }
    }

    return failed ? 1 : 0;
}
