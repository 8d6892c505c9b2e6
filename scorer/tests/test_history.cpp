#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/history.hpp"
#include <filesystem>
#include <fstream>

namespace {

std::string temp_history_path(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / ("clipscout_" + name + ".jsonl");
    std::filesystem::remove(path);
    return path.string();
}

HistoryEntry entry(const std::string& video_id, double score) {
    return {"2024-05-01T12:00:00Z", video_id, "title " + video_id, "heartwarming", score, "authentic"};
}

} // namespace

TEST_CASE("History log", "[history]") {
    SECTION("Missing file reads as empty") {
        HistoryLog log(temp_history_path("missing"));
        REQUIRE(log.recent(5).empty());
    }

    SECTION("Recent entries come back newest first") {
        auto path = temp_history_path("order");
        HistoryLog log(path);
        log.append(entry("first000000", 4.0));
        log.append(entry("second00000", 6.5));
        log.append(entry("third000000", 8.2));

        auto recent = log.recent(2);
        REQUIRE(recent.size() == 2);
        REQUIRE(recent[0].video_id == "third000000");
        REQUIRE(recent[0].score == Catch::Approx(8.2));
        REQUIRE(recent[1].video_id == "second00000");

        REQUIRE(log.recent(10).size() == 3);
        std::filesystem::remove(path);
    }

    SECTION("Malformed lines are skipped") {
        auto path = temp_history_path("malformed");
        HistoryLog log(path);
        log.append(entry("good0000001", 5.0));
        {
            std::ofstream out(path, std::ios::app);
            out << "{not json\n";
            out << "{\"title\": \"no category\"}\n";
        }
        log.append(entry("good0000002", 7.0));

        auto recent = log.recent(10);
        REQUIRE(recent.size() == 2);
        REQUIRE(recent[0].video_id == "good0000002");
        REQUIRE(recent[1].video_id == "good0000001");
        std::filesystem::remove(path);
    }

    SECTION("Clear empties the log") {
        auto path = temp_history_path("clear");
        HistoryLog log(path);
        log.append(entry("abc", 3.0));
        log.clear();
        REQUIRE(log.recent(5).empty());

        log.append(entry("after000001", 6.0));
        auto recent = log.recent(5);
        REQUIRE(recent.size() == 1);
        REQUIRE(recent[0].video_id == "after000001");
        std::filesystem::remove(path);
    }

    SECTION("Clearing a log that does not exist yet") {
        auto path = temp_history_path("clear_missing");
        HistoryLog log(path);
        REQUIRE_NOTHROW(log.clear());
        REQUIRE(log.recent(5).empty());
        std::filesystem::remove(path);
    }
}
