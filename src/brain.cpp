#include "halbrain/brain.hpp"

#include <algorithm>
#include <mutex>
#include <span>

#include "halbrain/logging.hpp"

namespace halbrain {

namespace {

const WordSet& empty_word_set() {
    static const WordSet empty;
    return empty;
}

} // namespace

Brain::Brain(GenerationConfig config) : config_(config) {
    // Draws are compared against 0..255, so 256 always continues and 0 never does.
    int clamped = std::clamp(config_.continue_chance, 0, 256);
    if (clamped != config_.continue_chance) {
        LOG_WARN("continue_chance ", config_.continue_chance, " is outside 0..256; using ", clamped);
        config_.continue_chance = clamped;
    }
}

void Brain::add_sentence(const Sentence& sentence) {
    if (sentence.size() < CHAIN_LENGTH) {
        return;  // too short to form a single chain
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    const size_t windows = sentence.size() - (CHAIN_LENGTH - 1);
    for (size_t i = 0; i < windows; ++i) {
        Chain chain(std::span<const Word>(sentence.data() + i, CHAIN_LENGTH));
        index_chain(chain);

        if (i == 0) {
            start_chains_.add(chain);
        } else {
            words_before_[chain].add(sentence[i - 1]);
        }

        if (i == windows - 1) {
            end_chains_.add(chain);
        } else {
            words_after_[chain].add(sentence[i + CHAIN_LENGTH]);
        }
    }
}

void Brain::add_sentences(const std::vector<Sentence>& sentences) {
    for (const auto& s : sentences) {
        add_sentence(s);
    }
}

void Brain::index_chain(const Chain& chain) {
    if (!chains_.add(chain)) {
        return;
    }
    for (const auto& w : chain) {
        word_chains_[w].add(chain);
    }
}

const WordSet& Brain::preceding(const Chain& chain) const {
    auto it = words_before_.find(chain);
    return it != words_before_.end() ? it->second : empty_word_set();
}

const WordSet& Brain::following(const Chain& chain) const {
    auto it = words_after_.find(chain);
    return it != words_after_.end() ? it->second : empty_word_set();
}

void Brain::restore_chain(const Chain& chain, const WordSet& before, const WordSet& after,
                          bool can_start, bool can_end) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    index_chain(chain);
    if (!before.empty()) {
        words_before_[chain].merge(before);
    }
    if (!after.empty()) {
        words_after_[chain].merge(after);
    }
    if (can_start) {
        start_chains_.add(chain);
    }
    if (can_end) {
        end_chains_.add(chain);
    }
}

BrainStats Brain::stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    BrainStats s;
    s.chains = chains_.size();
    s.words = word_chains_.size();
    s.start_chains = start_chains_.size();
    s.end_chains = end_chains_.size();
    return s;
}

bool Brain::empty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return chains_.empty();
}

bool Brain::has_chain(const Chain& chain) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return chains_.has(chain);
}

bool Brain::is_start_chain(const Chain& chain) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return start_chains_.has(chain);
}

bool Brain::is_end_chain(const Chain& chain) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return end_chains_.has(chain);
}

WordSet Brain::words_before(const Chain& chain) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return preceding(chain);
}

WordSet Brain::words_after(const Chain& chain) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return following(chain);
}

ChainSet Brain::chains_containing(const Word& word) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = word_chains_.find(word);
    return it != word_chains_.end() ? it->second : ChainSet{};
}

void Brain::for_each_chain(const std::function<void(const ChainRecord&)>& visit) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& chain : chains_) {
        ChainRecord record{
            chain,
            preceding(chain),
            following(chain),
            start_chains_.has(chain),
            end_chains_.has(chain),
        };
        visit(record);
    }
}

} // namespace halbrain
