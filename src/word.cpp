#include "halbrain/word.hpp"

#include <boost/locale.hpp>

#include <locale>

namespace halbrain {

namespace {

const std::locale& text_locale() {
    static const std::locale loc = [] {
        boost::locale::generator gen;
        return gen("en_US.UTF-8");
    }();
    return loc;
}

} // namespace

std::string normalize_text(std::string_view text) {
    if (text.empty()) return {};
    const std::string input(text);
    const std::string composed = boost::locale::normalize(input, boost::locale::norm_nfc, text_locale());
    return boost::locale::to_lower(composed, text_locale());
}

TagCategory classify_tag(std::string_view tag) noexcept {
    if (tag == "NN" || tag == "NNS") return TagCategory::CommonNoun;
    if (tag == "NNP" || tag == "NNPS") return TagCategory::ProperNoun;
    if (tag == "." || tag == "," || tag == ":" || tag == "(" || tag == ")" ||
        tag == "``" || tag == "''" || tag == "$" || tag == "#") {
        return TagCategory::Punctuation;
    }
    return TagCategory::Other;
}

const char* tag_category_name(TagCategory category) noexcept {
    switch (category) {
        case TagCategory::CommonNoun: return "common-noun";
        case TagCategory::ProperNoun: return "proper-noun";
        case TagCategory::Punctuation: return "punctuation";
        case TagCategory::Other: return "other";
    }
    return "other";
}

Word::Word(std::string_view tag, std::string_view text)
    : tag_(tag), text_(normalize_text(text)) {}

Word Word::from_normalized(std::string tag, std::string text) {
    Word w;
    w.tag_ = std::move(tag);
    w.text_ = std::move(text);
    return w;
}

bool Word::is_noun() const noexcept {
    TagCategory c = category();
    return c == TagCategory::CommonNoun || c == TagCategory::ProperNoun;
}

bool Word::is_proper_noun() const noexcept {
    return category() == TagCategory::ProperNoun;
}

bool Word::is_punctuation() const noexcept {
    return category() == TagCategory::Punctuation;
}

bool Word::is_hashtag() const noexcept {
    return is_noun() && !text_.empty() && text_[0] == '#';
}

bool Word::is_at_mention() const noexcept {
    return is_noun() && !text_.empty() && text_[0] == '@';
}

std::ostream& operator<<(std::ostream& os, const Word& word) {
    if (!word.valid()) return os << "<invalid>";
    return os << word.text() << '/' << word.tag();
}

namespace words {

const Word& period() {
    static const Word w(".", ".");
    return w;
}

const Word& question_mark() {
    static const Word w(".", "?");
    return w;
}

const Word& exclamation_mark() {
    static const Word w(".", "!");
    return w;
}

} // namespace words

} // namespace halbrain
