/**
 * Annotation: raw text to tagged sentences
 * ========================================
 *
 * Learning and reply construction consume sentences of (text, tag) words.
 * An Annotator produces them from free text. Keyword lookups only match
 * words that were tagged the same way when they were learned, so one
 * process should use one annotator for both.
 */

#pragma once

#include <string_view>
#include <vector>

#include "halbrain/sentence.hpp"

namespace halbrain::annotate {

/**
 * Annotator Interface
 */
class Annotator {
public:
    virtual ~Annotator() = default;

    /**
     * Split text into sentences and tag every token.
     * Text is lower-cased first; the result may be empty.
     */
    virtual std::vector<Sentence> annotate(std::string_view text) const = 0;

    virtual const char* name() const noexcept = 0;
};

/**
 * Rule-based tokenizer and tagger.
 *
 * Splits sentences after terminal punctuation, separates contractions
 * ("don't" -> "do" "n't"), tags punctuation with Penn Treebank punctuation
 * tags, closed-class words from a fixed lexicon, numbers as CD and
 * everything else as NN. Straight quotes alternate between `` and ''.
 *
 * There is no statistical model behind the NN fallback, so open-class
 * verbs and adjectives are tagged as nouns too. Replies built from this
 * annotator's output therefore pick keywords from more words than a real
 * part-of-speech tagger would offer.
 */
class SimpleAnnotator : public Annotator {
public:
    std::vector<Sentence> annotate(std::string_view text) const override;
    const char* name() const noexcept override { return "simple"; }
};

} // namespace halbrain::annotate
