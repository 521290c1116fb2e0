#include "halbrain/reply.hpp"

namespace halbrain {

ReplyContext ReplyContext::from_sentences(const std::vector<Sentence>& input) {
    ReplyContext ctx;
    for (const auto& s : input) {
        ctx.all_words.merge(sentence_words(s));
        ctx.nouns.merge(sentence_nouns(s));
        ctx.proper_nouns.merge(sentence_proper_nouns(s));
    }
    return ctx;
}

const WordSet& ReplyContext::keywords() const {
    // A lone proper noun would make every reply about the same thing, so
    // regular nouns join in; scoring still favours the proper noun.
    return proper_nouns.size() >= 2 ? proper_nouns : nouns;
}

int score_reply_candidate(const Sentence& candidate, const ReplyContext& context) {
    int score = 0;
    for (const auto& w : candidate) {
        if (w.is_proper_noun()) score += SCORE_PROPER_NOUN;
        if (context.nouns.has(w)) score += SCORE_INPUT_NOUN;
        if (context.proper_nouns.has(w)) score += SCORE_INPUT_PROPER_NOUN;
        if (context.all_words.has(w)) score += SCORE_INPUT_WORD;
    }
    return score;
}

} // namespace halbrain
