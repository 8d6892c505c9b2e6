#pragma once

#include <string>
#include <vector>
#include <optional>

struct TimestampMatch {
    std::string text;   // "2:15", "1:02:15"
    size_t offset;      // byte offset in the scanned text
    int seconds;
};

// Timestamp grammar for comment text:
//
//   timestamp := H ':' MM ':' SS | M ':' SS
//   H, M      := 1-2 digits
//   MM, SS    := exactly 2 digits, value < 60
//
// Candidates are maximal runs of digits and colons (trailing colons dropped),
// so "1:02:15" is one timestamp and never also "1:02" or "02:15". A run that
// contains a colon but does not fit the grammar is malformed and skipped.
// A leading "at " is not part of the timestamp text.
class TimestampParser {
public:
    static std::vector<TimestampMatch> find_all(const std::string& text);

    // Whole-string parse; nullopt when malformed
    static std::optional<int> parse(const std::string& candidate);
};
