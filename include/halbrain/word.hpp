#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace halbrain {

// Closed set of tag categories the reply logic cares about.
enum class TagCategory {
    CommonNoun,
    ProperNoun,
    Punctuation,
    Other
};

// Pure classification of a part-of-speech tag (Penn Treebank names).
TagCategory classify_tag(std::string_view tag) noexcept;

const char* tag_category_name(TagCategory category) noexcept;

// NFC-normalize and lower-case UTF-8 text.
std::string normalize_text(std::string_view text);

/**
 * A single annotated token.
 *
 * The text is normalized at construction so that equal words are always
 * byte-identical. A default-constructed Word has empty tag and text and
 * stands in for references that could not be resolved.
 */
class Word {
public:
    Word() = default;
    Word(std::string_view tag, std::string_view text);

    // Skips normalization; for text that is already in canonical form.
    static Word from_normalized(std::string tag, std::string text);

    const std::string& tag() const noexcept { return tag_; }
    const std::string& text() const noexcept { return text_; }

    bool valid() const noexcept { return !tag_.empty() || !text_.empty(); }

    TagCategory category() const noexcept { return classify_tag(tag_); }
    bool is_noun() const noexcept;
    bool is_proper_noun() const noexcept;
    bool is_punctuation() const noexcept;
    bool is_hashtag() const noexcept;
    bool is_at_mention() const noexcept;

    bool operator==(const Word& other) const noexcept {
        return tag_ == other.tag_ && text_ == other.text_;
    }
    bool operator!=(const Word& other) const noexcept { return !(*this == other); }

private:
    std::string tag_;
    std::string text_;
};

std::ostream& operator<<(std::ostream& os, const Word& word);

struct WordHasher {
    size_t operator()(const Word& w) const noexcept {
        size_t h = std::hash<std::string>()(w.text());
        h ^= std::hash<std::string>()(w.tag()) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

namespace words {

// Sentence terminators share the "." tag.
const Word& period();
const Word& question_mark();
const Word& exclamation_mark();

} // namespace words

} // namespace halbrain
