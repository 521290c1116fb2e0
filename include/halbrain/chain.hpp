#pragma once

#include <array>
#include <cstddef>
#include <ostream>
#include <span>

#include "halbrain/error.hpp"
#include "halbrain/word.hpp"

namespace halbrain {

// Number of words in every chain. Snapshots record it and refuse to load
// when it differs.
inline constexpr size_t CHAIN_LENGTH = 4;

/**
 * Fixed-length ordered tuple of words, the unit the brain learns.
 *
 * push_before/push_after slide the window one word towards the start or the
 * end of a sentence; the length never changes.
 */
class Chain {
public:
    using Words = std::array<Word, CHAIN_LENGTH>;

    Chain() = default;
    explicit Chain(const Words& words) : words_(words) {}

    // Throws InvalidArgumentError unless exactly CHAIN_LENGTH words are given.
    explicit Chain(std::span<const Word> words) {
        HALBRAIN_CHECK_ARGUMENT(words.size() == CHAIN_LENGTH,
                                "chain needs " + std::to_string(CHAIN_LENGTH) +
                                " words, got " + std::to_string(words.size()));
        for (size_t i = 0; i < CHAIN_LENGTH; ++i) {
            words_[i] = words[i];
        }
    }

    const Word& operator[](size_t i) const { return words_[i]; }
    const Word& front() const { return words_.front(); }
    const Word& back() const { return words_.back(); }
    const Words& words() const noexcept { return words_; }

    Words::const_iterator begin() const noexcept { return words_.begin(); }
    Words::const_iterator end() const noexcept { return words_.end(); }
    static constexpr size_t size() noexcept { return CHAIN_LENGTH; }

    bool contains(const Word& w) const {
        for (const auto& mine : words_) {
            if (mine == w) return true;
        }
        return false;
    }

    // Drop the last word, shift the rest one place right, put word first.
    void push_before(const Word& word) {
        for (size_t i = CHAIN_LENGTH - 1; i > 0; --i) {
            words_[i] = std::move(words_[i - 1]);
        }
        words_[0] = word;
    }

    // Drop the first word, shift the rest one place left, put word last.
    void push_after(const Word& word) {
        for (size_t i = 0; i + 1 < CHAIN_LENGTH; ++i) {
            words_[i] = std::move(words_[i + 1]);
        }
        words_[CHAIN_LENGTH - 1] = word;
    }

    bool operator==(const Chain& other) const { return words_ == other.words_; }
    bool operator!=(const Chain& other) const { return !(*this == other); }

private:
    Words words_;
};

inline std::ostream& operator<<(std::ostream& os, const Chain& chain) {
    os << '[';
    for (size_t i = 0; i < CHAIN_LENGTH; ++i) {
        if (i > 0) os << ' ';
        os << chain[i];
    }
    return os << ']';
}

struct ChainHasher {
    size_t operator()(const Chain& c) const noexcept {
        WordHasher word_hash;
        size_t h = 0;
        for (const auto& w : c) {
            h ^= word_hash(w) + 0x9e3779b9 + (h << 6) + (h >> 2);
        }
        return h;
    }
};

} // namespace halbrain
