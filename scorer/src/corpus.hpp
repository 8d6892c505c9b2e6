#pragma once

#include "video.hpp"
#include <string>
#include <vector>

// Lowercased text fields of a video. Absent optional inputs are empty strings.
struct TextCorpus {
    std::string title;
    std::string description;
    std::string comments;       // all comments joined with kCommentSeparator
    std::string transcript;
    std::string channel_desc;
    std::string tags;

    std::vector<std::string> comment_list;  // per comment, retrieval order

    // Title, description, tags and comments
    std::string combined() const;
};

class CorpusBuilder {
public:
    // No keyword contains a newline, so a match cannot span two comments
    static constexpr const char* kCommentSeparator = "\n";

    static TextCorpus build(const VideoRecord& video);
};
