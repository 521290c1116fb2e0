// =============================================================================
// Sentence generation
// =============================================================================
//
// A sentence is grown outwards from a seed chain that contains the keyword.
// The backward walk prepends words recorded as preceding the current chain
// until it reaches a start chain; the forward walk does the same with
// following words until an end chain. A boundary chain that also has
// recorded neighbours is an independent coin flip (continue_chance / 256)
// between stopping and growing further.
// =============================================================================

#include "halbrain/brain.hpp"

#include <mutex>

#include "halbrain/logging.hpp"
#include "halbrain/reply.hpp"

namespace halbrain {

Sentence Brain::make_sentence_with_keyword(const Word& keyword) {
    return make_sentence(keyword, false, false);
}

Sentence Brain::make_sentence_starting_keyword(const Word& keyword) {
    return make_sentence(keyword, true, false);
}

Sentence Brain::make_sentence_ending_keyword(const Word& keyword) {
    return make_sentence(keyword, false, true);
}

Sentence Brain::make_question() {
    LOG_DEBUG("building a question sentence");
    return make_sentence(words::question_mark(), false, true);
}

Sentence Brain::make_reason() {
    LOG_DEBUG("building a reason sentence");
    return make_sentence(words::question_mark(), true, false);
}

Sentence Brain::make_sentence(const Word& keyword, bool must_be_start, bool must_be_end) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    LOG_DEBUG("building a sentence for keyword ", keyword);
    auto it = word_chains_.find(keyword);
    if (it == word_chains_.end() || it->second.empty()) {
        return {};
    }

    std::optional<Chain> seed = select_seed(it->second, keyword, must_be_start, must_be_end);
    if (!seed) {
        return {};
    }
    LOG_DEBUG("starting chain is ", *seed);

    // A constrained seed already sits on the boundary it must keep, so the
    // walk on that side stops before any optional continuation.
    // before[0] is the word nearest the seed.
    std::vector<Word> before;
    if (!must_be_start) {
        before = walk_backward(*seed);
    }
    std::vector<Word> after;
    if (!must_be_end) {
        after = walk_forward(*seed, before.size() + CHAIN_LENGTH);
    }

    Sentence ret;
    ret.reserve(before.size() + CHAIN_LENGTH + after.size());
    ret.insert(ret.end(), before.rbegin(), before.rend());
    ret.insert(ret.end(), seed->begin(), seed->end());
    ret.insert(ret.end(), after.begin(), after.end());
    return ret;
}

std::optional<Chain> Brain::select_seed(const ChainSet& candidates, const Word& keyword,
                                        bool must_be_start, bool must_be_end) {
    if (must_be_end) {
        // Used for terminal punctuation, so most candidates qualify; the
        // ones skipped are things like quoted questions mid-sentence.
        for (const auto& c : candidates) {
            if (c.back() == keyword && end_chains_.has(c)) {
                return c;
            }
        }
        LOG_DEBUG("no end chains finishing with ", keyword);
        return std::nullopt;
    }

    if (must_be_start) {
        for (const auto& c : candidates) {
            if (c.front() == keyword && start_chains_.has(c)) {
                return c;
            }
        }
        LOG_DEBUG("no start chains beginning with ", keyword);
        return std::nullopt;
    }

    return candidates.choose_one(rng_);
}

std::vector<Word> Brain::walk_backward(const Chain& seed) {
    std::vector<Word> before;
    Chain current = seed;
    for (;;) {
        const WordSet& preceding_words = preceding(current);
        if (start_chains_.has(current)) {
            if (preceding_words.empty() || !continue_past_boundary(before.size() + CHAIN_LENGTH)) {
                break;
            }
        } else if (preceding_words.empty()) {
            LOG_FATAL("chain ", current, " cannot start a sentence but has no preceding words");
        }

        const Word& w = preceding_words.choose_one(rng_);
        before.push_back(w);
        current.push_before(w);
    }
    LOG_DEBUG("before words are ", before.size());
    return before;
}

std::vector<Word> Brain::walk_forward(const Chain& seed, size_t words_so_far) {
    std::vector<Word> after;
    Chain current = seed;
    for (;;) {
        const WordSet& following_words = following(current);
        if (end_chains_.has(current)) {
            if (following_words.empty() || !continue_past_boundary(words_so_far + after.size())) {
                break;
            }
        } else if (following_words.empty()) {
            LOG_FATAL("chain ", current, " cannot end a sentence but has no following words");
        }

        const Word& w = following_words.choose_one(rng_);
        after.push_back(w);
        current.push_after(w);
    }
    LOG_DEBUG("after words are ", after.size());
    return after;
}

bool Brain::continue_past_boundary(size_t words_so_far) {
    if (config_.max_words != 0 && words_so_far >= config_.max_words) {
        return false;
    }
    return rng_.below(256) < static_cast<uint32_t>(config_.continue_chance);
}

Sentence Brain::make_reply(const std::vector<Sentence>& input) {
    const ReplyContext ctx = ReplyContext::from_sentences(input);
    const WordSet& keywords = ctx.keywords();
    if (keywords.empty()) {
        return {};  // nothing to talk about
    }

    LOG_DEBUG("building replies with keywords: ", keywords);

    std::vector<Sentence> candidates;
    candidates.reserve(keywords.size());
    for (const auto& kw : keywords) {
        Sentence s = make_sentence_with_keyword(kw);
        if (!s.empty()) {
            candidates.push_back(std::move(s));
        }
    }

    if (candidates.empty()) {
        LOG_DEBUG("no sentences were generated");
        return {};
    }
    if (candidates.size() == 1) {
        LOG_DEBUG("only one sentence generated, so it wins by default");
        return candidates.front();
    }

    size_t best = 0;
    int best_score = -1;
    for (size_t i = 0; i < candidates.size(); ++i) {
        int score = score_reply_candidate(candidates[i], ctx);
        if (score > best_score) {
            best_score = score;
            best = i;
            LOG_DEBUG("sentence \"", to_string(candidates[i]), "\" scored ", score, ", the new winner");
        } else {
            LOG_DEBUG("sentence \"", to_string(candidates[i]), "\" scored ", score, ", not enough to win");
        }
    }
    return candidates[best];
}

} // namespace halbrain
