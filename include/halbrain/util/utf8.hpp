#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace halbrain::util {

inline constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

// Decode the codepoint starting at byte offset pos and advance pos past it.
// Invalid or truncated sequences yield U+FFFD and advance by one byte.
uint32_t next_codepoint(std::string_view data, size_t& pos);

// Decode UTF-8 bytes to Unicode codepoints (a leading BOM is skipped)
std::vector<uint32_t> decode_utf8(std::string_view data);

// Encode codepoint to UTF-8 bytes
std::string encode_utf8(uint32_t codepoint);

// Append the UTF-8 encoding of codepoint to out
void append_utf8(std::string& out, uint32_t codepoint);

} // namespace halbrain::util
