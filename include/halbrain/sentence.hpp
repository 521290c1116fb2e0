#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "halbrain/index_set.hpp"
#include "halbrain/word.hpp"

namespace halbrain {

// An ordered sequence of words. An empty Sentence means "nothing to say".
using Sentence = std::vector<Word>;

// Distinct words of the sentence.
WordSet sentence_words(const Sentence& s);

// Distinct common and proper nouns.
WordSet sentence_nouns(const Sentence& s);

WordSet sentence_proper_nouns(const Sentence& s);

// Drops one trailing period, unless the period before it makes an ellipsis.
Sentence trim_period(const Sentence& s);

// Human-readable rendering with punctuation-aware spacing.
std::string to_string(const Sentence& s);

// "text/TAG text/TAG ..." rendering.
std::string to_tagged_string(const Sentence& s);

// Inverse of to_tagged_string. Each whitespace-separated token is split at
// its last '/'. Throws InvalidArgumentError for a token with no tag.
Sentence parse_tagged(std::string_view line);

} // namespace halbrain
