#include "halbrain/annotate/annotator.hpp"

#include <initializer_list>
#include <string>
#include <unordered_map>

#include "halbrain/util/utf8.hpp"
#include "halbrain/word.hpp"

namespace halbrain::annotate {

namespace {

struct RawToken {
    std::string text;
    bool is_word;
};

const std::unordered_map<std::string, std::string>& closed_class_lexicon() {
    static const std::unordered_map<std::string, std::string> lexicon = [] {
        std::unordered_map<std::string, std::string> m;
        auto put = [&m](const char* tag, std::initializer_list<const char*> words) {
            for (const char* w : words) m.emplace(w, tag);
        };
        put("DT", {"the", "a", "an", "this", "that", "these", "those", "every", "each",
                   "some", "any", "no", "all", "both", "another"});
        put("IN", {"of", "in", "on", "at", "by", "for", "with", "about", "from", "into",
                   "over", "under", "after", "before", "between", "through", "during",
                   "without", "against", "among", "since", "until", "upon", "than",
                   "like", "because", "if", "while", "although", "though", "whether"});
        put("CC", {"and", "or", "but", "nor", "yet", "so"});
        put("PRP", {"i", "you", "he", "she", "it", "we", "they", "me", "him", "her", "us",
                    "them", "myself", "yourself", "himself", "herself", "itself",
                    "ourselves", "themselves"});
        put("PRP$", {"my", "your", "his", "its", "our", "their"});
        put("MD", {"can", "could", "will", "would", "shall", "should", "may", "might",
                   "must", "'ll", "'d", "ca", "wo"});
        put("VBZ", {"is", "has", "does"});
        put("VBP", {"am", "are", "have", "do", "'re", "'ve", "'m"});
        put("VBD", {"was", "were", "had", "did"});
        put("VB", {"be"});
        put("VBN", {"been"});
        put("TO", {"to"});
        put("RB", {"not", "n't", "very", "too", "also", "just", "never", "always", "often",
                   "here", "there", "now", "then"});
        put("WRB", {"how", "when", "where", "why"});
        put("WP", {"what", "who", "whom"});
        put("WDT", {"which"});
        put("UH", {"yes", "hello", "hi", "oh"});
        put("POS", {"'s"});
        return m;
    }();
    return lexicon;
}

bool is_space(uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f' || cp == '\v' ||
           cp == 0xA0 || cp == 0x2028 || cp == 0x2029 || cp == 0x3000;
}

bool is_apostrophe(uint32_t cp) {
    return cp == '\'' || cp == 0x2019;
}

bool is_non_ascii_punct(uint32_t cp) {
    switch (cp) {
        case 0x00A1: case 0x00AB: case 0x00BB: case 0x00BF:  // ¡ « » ¿
        case 0x2013: case 0x2014:                            // dashes
        case 0x2018: case 0x2019: case 0x201C: case 0x201D:  // curly quotes
        case 0x2026:                                         // ellipsis
        case 0xFFFD:
            return true;
        default:
            return false;
    }
}

bool is_word_cp(uint32_t cp) {
    if (cp < 0x80) {
        return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') ||
               (cp >= '0' && cp <= '9') || cp == '_';
    }
    return !is_space(cp) && !is_non_ascii_punct(cp);
}

bool is_digit(uint32_t cp) {
    return cp >= '0' && cp <= '9';
}

bool is_number(const std::string& s) {
    if (s.empty() || s[0] < '0' || s[0] > '9') return false;
    for (char c : s) {
        if ((c < '0' || c > '9') && c != '.' && c != ',') return false;
    }
    return true;
}

std::vector<RawToken> tokenize(const std::vector<uint32_t>& cps) {
    std::vector<RawToken> tokens;
    std::string word;

    auto flush = [&] {
        if (!word.empty()) {
            tokens.push_back({word, true});
            word.clear();
        }
    };
    auto next_is_word = [&](size_t i) { return i + 1 < cps.size() && is_word_cp(cps[i + 1]); };

    for (size_t i = 0; i < cps.size(); ++i) {
        const uint32_t cp = cps[i];

        if (is_space(cp)) {
            flush();
        } else if (is_word_cp(cp)) {
            util::append_utf8(word, cp);
        } else if ((cp == '#' || cp == '@') && word.empty() && next_is_word(i)) {
            util::append_utf8(word, cp);
        } else if (cp == '-' && !word.empty() && next_is_word(i)) {
            word.push_back('-');
        } else if ((cp == '.' || cp == ',') && is_number(word) &&
                   i + 1 < cps.size() && is_digit(cps[i + 1])) {
            word.push_back(static_cast<char>(cp));
        } else if (is_apostrophe(cp) && !word.empty() && next_is_word(i)) {
            size_t j = i + 1;
            std::string suffix;
            while (j < cps.size() && is_word_cp(cps[j])) {
                util::append_utf8(suffix, cps[j]);
                ++j;
            }
            if (suffix == "t" && word.size() > 1 && word.back() == 'n') {
                word.pop_back();
                flush();
                tokens.push_back({"n't", true});
            } else if (suffix == "s" || suffix == "re" || suffix == "ve" ||
                       suffix == "ll" || suffix == "d" || suffix == "m") {
                flush();
                tokens.push_back({"'" + suffix, true});
            } else {
                word.push_back('\'');
                word += suffix;
            }
            i = j - 1;
        } else {
            flush();
            tokens.push_back({util::encode_utf8(cp), false});
        }
    }
    flush();
    return tokens;
}

std::string word_tag(const std::string& text) {
    const auto& lexicon = closed_class_lexicon();
    auto it = lexicon.find(text);
    if (it != lexicon.end()) return it->second;
    if (is_number(text)) return "CD";
    return "NN";
}

std::string punctuation_tag(const std::string& text, bool& double_open, bool& single_open) {
    if (text == "." || text == "!" || text == "?") return ".";
    if (text == ",") return ",";
    if (text == ";" || text == ":" || text == "-" || text == "\xE2\x80\x93" || text == "\xE2\x80\x94" ||
        text == "\xE2\x80\xA6") {
        return ":";
    }
    if (text == "(" || text == "[" || text == "{") return "(";
    if (text == ")" || text == "]" || text == "}") return ")";
    if (text == "$") return "$";
    if (text == "#") return "#";

    if (text == "\"" || text == "\xC2\xAB" || text == "\xC2\xBB") {
        double_open = !double_open;
        return double_open ? "``" : "''";
    }
    if (text == "\xE2\x80\x9C") {
        double_open = true;
        return "``";
    }
    if (text == "\xE2\x80\x9D") {
        double_open = false;
        return "''";
    }
    if (text == "'") {
        single_open = !single_open;
        return single_open ? "``" : "''";
    }
    if (text == "\xE2\x80\x98") {
        single_open = true;
        return "``";
    }
    if (text == "\xE2\x80\x99") {
        single_open = false;
        return "''";
    }
    return "SYM";
}

} // namespace

std::vector<Sentence> SimpleAnnotator::annotate(std::string_view text) const {
    const std::string normalized = normalize_text(text);
    const std::vector<RawToken> tokens = tokenize(util::decode_utf8(normalized));

    std::vector<Sentence> sentences;
    Sentence current;
    bool ended = false;
    bool double_open = false;
    bool single_open = false;

    for (const auto& tok : tokens) {
        std::string tag = tok.is_word ? word_tag(tok.text)
                                      : punctuation_tag(tok.text, double_open, single_open);

        // Closing quotes and brackets stay with the sentence they close.
        bool trails = tag == "''" || tag == ")" || tag == ".";
        if (ended && !trails) {
            sentences.push_back(std::move(current));
            current.clear();
            ended = false;
        }
        current.push_back(Word::from_normalized(std::move(tag), tok.text));
        if (current.back().tag() == ".") {
            ended = true;
        }
    }
    if (!current.empty()) {
        sentences.push_back(std::move(current));
    }
    return sentences;
}

} // namespace halbrain::annotate
