#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "halbrain/chain.hpp"
#include "halbrain/config.hpp"
#include "halbrain/index_set.hpp"
#include "halbrain/random.hpp"
#include "halbrain/sentence.hpp"
#include "halbrain/word.hpp"

namespace halbrain {

struct BrainStats {
    size_t chains = 0;
    size_t words = 0;
    size_t start_chains = 0;
    size_t end_chains = 0;
};

/**
 * The chain index.
 *
 * Learning slides a CHAIN_LENGTH window over each sentence and records, per
 * chain, the words seen immediately before and after it and whether it
 * opened or closed a sentence. Generation walks those records outwards from
 * a chain holding a keyword until both ends reach a legal sentence
 * boundary.
 *
 * Every chain that is not a start chain has at least one recorded
 * preceding word (and likewise for end chains and following words); the
 * walks rely on this to terminate.
 *
 * Thread safety: learning takes the lock exclusively for one sentence,
 * generation takes it shared for one complete sentence.
 */
class Brain {
public:
    explicit Brain(GenerationConfig config = {});

    Brain(const Brain&) = delete;
    Brain& operator=(const Brain&) = delete;

    // Sentences shorter than CHAIN_LENGTH are ignored.
    void add_sentence(const Sentence& sentence);
    void add_sentences(const std::vector<Sentence>& sentences);

    // All of these return an empty Sentence when nothing can be built.
    Sentence make_sentence_with_keyword(const Word& keyword);
    Sentence make_sentence_starting_keyword(const Word& keyword);
    Sentence make_sentence_ending_keyword(const Word& keyword);
    Sentence make_reply(const std::vector<Sentence>& input);

    // A sentence that ends with a question mark.
    Sentence make_question();

    // A sentence that opens with the question-mark word; the chat front end
    // uses it to answer "why" questions.
    Sentence make_reason();

    void seed(uint32_t s) { rng_.seed(s); }
    const GenerationConfig& generation_config() const noexcept { return config_; }

    BrainStats stats() const;
    bool empty() const;

    bool has_chain(const Chain& chain) const;
    bool is_start_chain(const Chain& chain) const;
    bool is_end_chain(const Chain& chain) const;
    WordSet words_before(const Chain& chain) const;
    WordSet words_after(const Chain& chain) const;
    ChainSet chains_containing(const Word& word) const;

    struct ChainRecord {
        const Chain& chain;
        const WordSet& before;
        const WordSet& after;
        bool can_start;
        bool can_end;
    };

    // Visits every chain under the shared lock, in learning order.
    void for_each_chain(const std::function<void(const ChainRecord&)>& visit) const;

    // Inserts one chain together with its adjacency and boundary flags.
    void restore_chain(const Chain& chain, const WordSet& before, const WordSet& after,
                       bool can_start, bool can_end);

private:
    Sentence make_sentence(const Word& keyword, bool must_be_start, bool must_be_end);
    std::optional<Chain> select_seed(const ChainSet& candidates, const Word& keyword,
                                     bool must_be_start, bool must_be_end);
    std::vector<Word> walk_backward(const Chain& seed);
    std::vector<Word> walk_forward(const Chain& seed, size_t words_so_far);
    bool continue_past_boundary(size_t words_so_far);

    // Caller holds the lock (exclusive for index_chain).
    void index_chain(const Chain& chain);
    const WordSet& preceding(const Chain& chain) const;
    const WordSet& following(const Chain& chain) const;

    mutable std::shared_mutex mutex_;
    GenerationConfig config_;
    RandomSource rng_;

    ChainSet chains_;
    std::unordered_map<Word, ChainSet, WordHasher> word_chains_;
    std::unordered_map<Chain, WordSet, ChainHasher> words_before_;
    std::unordered_map<Chain, WordSet, ChainHasher> words_after_;
    ChainSet start_chains_;
    ChainSet end_chains_;
};

} // namespace halbrain
