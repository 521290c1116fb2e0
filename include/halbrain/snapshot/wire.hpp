// =============================================================================
// wire.hpp - Self-describing binary encoding for brain snapshots
// =============================================================================
// Values use the MessagePack layout: integers, booleans, nil, UTF-8
// strings, arrays and maps, all multi-byte lengths big-endian. Only the
// subset the snapshot needs is written; the reader additionally skips
// floats, binary and extension values it does not understand.
// =============================================================================

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace halbrain::snapshot {

enum class WireType {
    Nil,
    Bool,
    Integer,
    Float,
    String,
    Binary,
    Array,
    Map,
    Extension
};

const char* wire_type_name(WireType type) noexcept;

class PackWriter {
public:
    void write_nil();
    void write_bool(bool value);
    void write_int(int64_t value);
    void write_string(std::string_view value);
    void write_array_header(uint32_t count);
    void write_map_header(uint32_t count);

    // Appends bytes produced by another writer.
    void write_raw(std::string_view bytes) { buffer_.append(bytes); }

    const std::string& bytes() const noexcept { return buffer_; }
    std::string take() { return std::move(buffer_); }

private:
    void put8(uint8_t v) { buffer_.push_back(static_cast<char>(v)); }
    void put16(uint16_t v);
    void put32(uint32_t v);
    void put64(uint64_t v);

    std::string buffer_;
};

/**
 * Sequential reader over an encoded buffer.
 *
 * Every read checks the type tag and the remaining length; any mismatch
 * throws SnapshotFormatError with MALFORMED_SNAPSHOT and the byte offset.
 */
class PackReader {
public:
    explicit PackReader(std::string_view data) : data_(data) {}

    WireType peek_type() const;
    bool at_end() const noexcept { return pos_ >= data_.size(); }

    // Consumes a nil and returns true, or leaves the input alone.
    bool read_nil();
    bool read_bool();
    int64_t read_int();

    // An integer used as a table index. Unsigned values beyond the int64
    // range come back as -1 instead of failing the read.
    int64_t read_index();
    std::string read_string();
    uint32_t read_array_header();
    uint32_t read_map_header();

    // An array header, or nil read as an empty array.
    uint32_t read_array_header_or_nil();

    // Skips one complete value, including nested containers.
    void skip();

private:
    uint8_t peek_byte() const;
    uint8_t get8();
    uint16_t get16();
    uint32_t get32();
    uint64_t get64();
    std::string_view get_bytes(size_t n);
    [[noreturn]] void fail(const std::string& what) const;

    std::string_view data_;
    size_t pos_ = 0;
};

} // namespace halbrain::snapshot
