#pragma once

#include <vector>

#include "halbrain/index_set.hpp"
#include "halbrain/sentence.hpp"

namespace halbrain {

// Points awarded per word of a reply candidate. The bonuses stack, so a
// proper noun from the input earns all four.
inline constexpr int SCORE_PROPER_NOUN = 2;
inline constexpr int SCORE_INPUT_NOUN = 3;
inline constexpr int SCORE_INPUT_PROPER_NOUN = 4;
inline constexpr int SCORE_INPUT_WORD = 1;

// What the input of one conversational turn talks about.
struct ReplyContext {
    WordSet all_words;
    WordSet nouns;          // common and proper
    WordSet proper_nouns;

    static ReplyContext from_sentences(const std::vector<Sentence>& input);

    // Proper nouns when there are at least two of them, otherwise all nouns.
    const WordSet& keywords() const;
};

int score_reply_candidate(const Sentence& candidate, const ReplyContext& context);

} // namespace halbrain
