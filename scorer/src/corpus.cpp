#include "corpus.hpp"
#include "util.hpp"

std::string TextCorpus::combined() const {
    return title + "\n" + description + "\n" + tags + "\n" + comments;
}

TextCorpus CorpusBuilder::build(const VideoRecord& video) {
    TextCorpus corpus;
    corpus.title = util::to_lower(video.title);
    corpus.description = util::to_lower(video.description);

    for (const auto& tag : video.tags) {
        if (!corpus.tags.empty()) corpus.tags += kCommentSeparator;
        corpus.tags += util::to_lower(tag);
    }

    corpus.comment_list.reserve(video.comments.size());
    for (const auto& comment : video.comments) {
        corpus.comment_list.push_back(util::to_lower(comment));
        if (!corpus.comments.empty()) corpus.comments += kCommentSeparator;
        corpus.comments += corpus.comment_list.back();
    }

    if (video.has_transcript()) {
        const auto& t = *video.transcript;
        if (!t.text.empty()) {
            corpus.transcript = util::to_lower(t.text);
        } else {
            for (const auto& seg : t.segments) {
                if (!corpus.transcript.empty()) corpus.transcript += " ";
                corpus.transcript += util::to_lower(seg.text);
            }
        }
    }

    if (video.channel_info) {
        corpus.channel_desc = util::to_lower(video.channel_info->description);
    }

    return corpus;
}
