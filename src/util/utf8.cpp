#include "halbrain/util/utf8.hpp"

namespace halbrain::util {

uint32_t next_codepoint(std::string_view data, size_t& pos) {
    const auto* p = reinterpret_cast<const uint8_t*>(data.data()) + pos;
    const size_t remaining = data.size() - pos;
    const uint8_t b0 = p[0];

    auto continuation = [&](size_t i) { return (p[i] & 0xC0) == 0x80; };

    if (b0 < 0x80) {
        pos += 1;
        return b0;
    }
    if ((b0 & 0xE0) == 0xC0 && remaining >= 2 && continuation(1)) {
        uint32_t cp = ((b0 & 0x1F) << 6) | (p[1] & 0x3F);
        pos += 2;
        return cp < 0x80 ? REPLACEMENT_CHARACTER : cp;  // overlong
    }
    if ((b0 & 0xF0) == 0xE0 && remaining >= 3 && continuation(1) && continuation(2)) {
        uint32_t cp = ((b0 & 0x0F) << 12) | ((p[1] & 0x3F) << 6) | (p[2] & 0x3F);
        pos += 3;
        if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) return REPLACEMENT_CHARACTER;
        return cp;
    }
    if ((b0 & 0xF8) == 0xF0 && remaining >= 4 && continuation(1) && continuation(2) && continuation(3)) {
        uint32_t cp = ((b0 & 0x07) << 18) | ((p[1] & 0x3F) << 12) | ((p[2] & 0x3F) << 6) | (p[3] & 0x3F);
        pos += 4;
        if (cp < 0x10000 || cp > 0x10FFFF) return REPLACEMENT_CHARACTER;
        return cp;
    }

    // Invalid start byte, bad continuation or insufficient bytes
    pos += 1;
    return REPLACEMENT_CHARACTER;
}

std::vector<uint32_t> decode_utf8(std::string_view data) {
    std::vector<uint32_t> codepoints;
    codepoints.reserve(data.size());

    size_t pos = 0;
    if (data.size() >= 3 &&
        static_cast<uint8_t>(data[0]) == 0xEF &&
        static_cast<uint8_t>(data[1]) == 0xBB &&
        static_cast<uint8_t>(data[2]) == 0xBF) {
        pos = 3;
    }

    while (pos < data.size()) {
        codepoints.push_back(next_codepoint(data, pos));
    }
    return codepoints;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string encode_utf8(uint32_t cp) {
    std::string result;
    append_utf8(result, cp);
    return result;
}

} // namespace halbrain::util
