#include "halbrain/snapshot/wire.hpp"

#include <limits>

#include "halbrain/error.hpp"

namespace halbrain::snapshot {

const char* wire_type_name(WireType type) noexcept {
    switch (type) {
        case WireType::Nil: return "nil";
        case WireType::Bool: return "bool";
        case WireType::Integer: return "integer";
        case WireType::Float: return "float";
        case WireType::String: return "string";
        case WireType::Binary: return "binary";
        case WireType::Array: return "array";
        case WireType::Map: return "map";
        case WireType::Extension: return "extension";
    }
    return "unknown";
}

// ============================================================================
// PackWriter
// ============================================================================

void PackWriter::put16(uint16_t v) {
    put8(static_cast<uint8_t>(v >> 8));
    put8(static_cast<uint8_t>(v));
}

void PackWriter::put32(uint32_t v) {
    put16(static_cast<uint16_t>(v >> 16));
    put16(static_cast<uint16_t>(v));
}

void PackWriter::put64(uint64_t v) {
    put32(static_cast<uint32_t>(v >> 32));
    put32(static_cast<uint32_t>(v));
}

void PackWriter::write_nil() {
    put8(0xc0);
}

void PackWriter::write_bool(bool value) {
    put8(value ? 0xc3 : 0xc2);
}

void PackWriter::write_int(int64_t value) {
    if (value >= 0) {
        uint64_t u = static_cast<uint64_t>(value);
        if (u <= 0x7f) {
            put8(static_cast<uint8_t>(u));
        } else if (u <= 0xff) {
            put8(0xcc);
            put8(static_cast<uint8_t>(u));
        } else if (u <= 0xffff) {
            put8(0xcd);
            put16(static_cast<uint16_t>(u));
        } else if (u <= 0xffffffffULL) {
            put8(0xce);
            put32(static_cast<uint32_t>(u));
        } else {
            put8(0xcf);
            put64(u);
        }
        return;
    }

    if (value >= -32) {
        put8(static_cast<uint8_t>(value));  // negative fixint
    } else if (value >= std::numeric_limits<int8_t>::min()) {
        put8(0xd0);
        put8(static_cast<uint8_t>(value));
    } else if (value >= std::numeric_limits<int16_t>::min()) {
        put8(0xd1);
        put16(static_cast<uint16_t>(value));
    } else if (value >= std::numeric_limits<int32_t>::min()) {
        put8(0xd2);
        put32(static_cast<uint32_t>(value));
    } else {
        put8(0xd3);
        put64(static_cast<uint64_t>(value));
    }
}

void PackWriter::write_string(std::string_view value) {
    const size_t n = value.size();
    if (n <= 31) {
        put8(static_cast<uint8_t>(0xa0 | n));
    } else if (n <= 0xff) {
        put8(0xd9);
        put8(static_cast<uint8_t>(n));
    } else if (n <= 0xffff) {
        put8(0xda);
        put16(static_cast<uint16_t>(n));
    } else {
        put8(0xdb);
        put32(static_cast<uint32_t>(n));
    }
    buffer_.append(value);
}

void PackWriter::write_array_header(uint32_t count) {
    if (count <= 15) {
        put8(static_cast<uint8_t>(0x90 | count));
    } else if (count <= 0xffff) {
        put8(0xdc);
        put16(static_cast<uint16_t>(count));
    } else {
        put8(0xdd);
        put32(count);
    }
}

void PackWriter::write_map_header(uint32_t count) {
    if (count <= 15) {
        put8(static_cast<uint8_t>(0x80 | count));
    } else if (count <= 0xffff) {
        put8(0xde);
        put16(static_cast<uint16_t>(count));
    } else {
        put8(0xdf);
        put32(count);
    }
}

// ============================================================================
// PackReader
// ============================================================================

void PackReader::fail(const std::string& what) const {
    throw SnapshotFormatError(ErrorCode::MALFORMED_SNAPSHOT,
                              what + " at byte " + std::to_string(pos_));
}

uint8_t PackReader::peek_byte() const {
    if (pos_ >= data_.size()) fail("unexpected end of data");
    return static_cast<uint8_t>(data_[pos_]);
}

uint8_t PackReader::get8() {
    uint8_t b = peek_byte();
    ++pos_;
    return b;
}

uint16_t PackReader::get16() {
    uint16_t hi = get8();
    return static_cast<uint16_t>((hi << 8) | get8());
}

uint32_t PackReader::get32() {
    uint32_t hi = get16();
    return (hi << 16) | get16();
}

uint64_t PackReader::get64() {
    uint64_t hi = get32();
    return (hi << 32) | get32();
}

std::string_view PackReader::get_bytes(size_t n) {
    if (n > data_.size() - pos_) fail("value runs past end of data");
    std::string_view out = data_.substr(pos_, n);
    pos_ += n;
    return out;
}

WireType PackReader::peek_type() const {
    const uint8_t b = peek_byte();
    if (b <= 0x7f || b >= 0xe0) return WireType::Integer;
    if (b <= 0x8f) return WireType::Map;
    if (b <= 0x9f) return WireType::Array;
    if (b <= 0xbf) return WireType::String;
    switch (b) {
        case 0xc0: return WireType::Nil;
        case 0xc2: case 0xc3: return WireType::Bool;
        case 0xc4: case 0xc5: case 0xc6: return WireType::Binary;
        case 0xc7: case 0xc8: case 0xc9: return WireType::Extension;
        case 0xca: case 0xcb: return WireType::Float;
        case 0xcc: case 0xcd: case 0xce: case 0xcf:
        case 0xd0: case 0xd1: case 0xd2: case 0xd3:
            return WireType::Integer;
        case 0xd4: case 0xd5: case 0xd6: case 0xd7: case 0xd8:
            return WireType::Extension;
        case 0xd9: case 0xda: case 0xdb: return WireType::String;
        case 0xdc: case 0xdd: return WireType::Array;
        case 0xde: case 0xdf: return WireType::Map;
        default: break;
    }
    fail("invalid type byte");
}

bool PackReader::read_nil() {
    if (peek_byte() != 0xc0) return false;
    ++pos_;
    return true;
}

bool PackReader::read_bool() {
    uint8_t b = peek_byte();
    if (b == 0xc2 || b == 0xc3) {
        ++pos_;
        return b == 0xc3;
    }
    fail(std::string("expected bool, found ") + wire_type_name(peek_type()));
}

int64_t PackReader::read_index() {
    if (peek_byte() == 0xcf) {
        ++pos_;
        uint64_t u = get64();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return -1;
        return static_cast<int64_t>(u);
    }
    return read_int();
}

int64_t PackReader::read_int() {
    const uint8_t b = peek_byte();
    if (b <= 0x7f) {
        ++pos_;
        return b;
    }
    if (b >= 0xe0) {
        ++pos_;
        return static_cast<int8_t>(b);
    }
    switch (b) {
        case 0xcc: ++pos_; return get8();
        case 0xcd: ++pos_; return get16();
        case 0xce: ++pos_; return get32();
        case 0xcf: {
            ++pos_;
            uint64_t u = get64();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) fail("integer out of range");
            return static_cast<int64_t>(u);
        }
        case 0xd0: ++pos_; return static_cast<int8_t>(get8());
        case 0xd1: ++pos_; return static_cast<int16_t>(get16());
        case 0xd2: ++pos_; return static_cast<int32_t>(get32());
        case 0xd3: ++pos_; return static_cast<int64_t>(get64());
        default: break;
    }
    fail(std::string("expected integer, found ") + wire_type_name(peek_type()));
}

std::string PackReader::read_string() {
    const uint8_t b = peek_byte();
    size_t n = 0;
    if (b >= 0xa0 && b <= 0xbf) {
        ++pos_;
        n = b & 0x1f;
    } else if (b == 0xd9 || b == 0xc4) {
        ++pos_;
        n = get8();
    } else if (b == 0xda || b == 0xc5) {
        ++pos_;
        n = get16();
    } else if (b == 0xdb || b == 0xc6) {
        ++pos_;
        n = get32();
    } else {
        fail(std::string("expected string, found ") + wire_type_name(peek_type()));
    }
    return std::string(get_bytes(n));
}

uint32_t PackReader::read_array_header() {
    const uint8_t b = peek_byte();
    if (b >= 0x90 && b <= 0x9f) {
        ++pos_;
        return b & 0x0f;
    }
    if (b == 0xdc) { ++pos_; return get16(); }
    if (b == 0xdd) { ++pos_; return get32(); }
    fail(std::string("expected array, found ") + wire_type_name(peek_type()));
}

uint32_t PackReader::read_array_header_or_nil() {
    if (read_nil()) return 0;
    return read_array_header();
}

uint32_t PackReader::read_map_header() {
    const uint8_t b = peek_byte();
    if (b >= 0x80 && b <= 0x8f) {
        ++pos_;
        return b & 0x0f;
    }
    if (b == 0xde) { ++pos_; return get16(); }
    if (b == 0xdf) { ++pos_; return get32(); }
    fail(std::string("expected map, found ") + wire_type_name(peek_type()));
}

void PackReader::skip() {
    uint64_t pending = 1;
    while (pending > 0) {
        --pending;
        const uint8_t b = peek_byte();
        switch (peek_type()) {
            case WireType::Nil:
            case WireType::Bool:
                ++pos_;
                break;
            case WireType::Integer:
                read_int();
                break;
            case WireType::Float:
                ++pos_;
                get_bytes(b == 0xca ? 4 : 8);
                break;
            case WireType::String:
            case WireType::Binary:
                read_string();
                break;
            case WireType::Array:
                pending += read_array_header();
                break;
            case WireType::Map:
                pending += 2ULL * read_map_header();
                break;
            case WireType::Extension: {
                ++pos_;
                size_t n = 0;
                switch (b) {
                    case 0xd4: n = 1; break;
                    case 0xd5: n = 2; break;
                    case 0xd6: n = 4; break;
                    case 0xd7: n = 8; break;
                    case 0xd8: n = 16; break;
                    case 0xc7: n = get8(); break;
                    case 0xc8: n = get16(); break;
                    default: n = get32(); break;
                }
                get_bytes(n + 1);  // type byte plus payload
                break;
            }
        }
    }
}

} // namespace halbrain::snapshot
