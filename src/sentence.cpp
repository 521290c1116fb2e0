#include "halbrain/sentence.hpp"

#include <cctype>

#include "halbrain/error.hpp"

namespace halbrain {

WordSet sentence_words(const Sentence& s) {
    WordSet ret;
    for (const auto& w : s) ret.add(w);
    return ret;
}

WordSet sentence_nouns(const Sentence& s) {
    WordSet ret;
    for (const auto& w : s) {
        if (w.is_noun()) ret.add(w);
    }
    return ret;
}

WordSet sentence_proper_nouns(const Sentence& s) {
    WordSet ret;
    for (const auto& w : s) {
        if (w.is_proper_noun()) ret.add(w);
    }
    return ret;
}

Sentence trim_period(const Sentence& s) {
    if (s.empty() || s.back() != words::period()) {
        return s;
    }
    if (s.size() > 1 && s[s.size() - 2] == words::period()) {
        return s;  // ellipsis
    }
    return Sentence(s.begin(), s.end() - 1);
}

std::string to_string(const Sentence& s) {
    std::string ret;
    for (size_t i = 0; i < s.size(); ++i) {
        const Word& w = s[i];
        if (i > 0) {
            const Word& prev = s[i - 1];
            bool space = true;
            if (w.tag() == "." || w.tag() == "," || w.tag() == ":" ||
                w.tag() == ")" || w.tag() == "''") {
                space = false;
            } else if (prev.tag() == "(" || prev.tag() == "``" || prev.tag() == "$") {
                space = false;
            } else if (w.text().find('\'') != std::string::npos) {
                space = false;
            }
            if (space) ret.push_back(' ');
        }
        ret += w.text();
    }
    return ret;
}

std::string to_tagged_string(const Sentence& s) {
    std::string ret;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i > 0) ret.push_back(' ');
        ret += s[i].text();
        ret.push_back('/');
        ret += s[i].tag();
    }
    return ret;
}

Sentence parse_tagged(std::string_view line) {
    Sentence ret;
    size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        if (pos >= line.size()) break;

        size_t end = pos;
        while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end]))) ++end;
        std::string_view token = line.substr(pos, end - pos);
        pos = end;

        size_t slash = token.rfind('/');
        if (slash == std::string_view::npos || slash == 0 || slash + 1 == token.size()) {
            throw InvalidArgumentError("tagged token '" + std::string(token) + "' is not text/TAG");
        }
        ret.emplace_back(token.substr(slash + 1), token.substr(0, slash));
    }
    return ret;
}

} // namespace halbrain
