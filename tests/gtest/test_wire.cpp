// =============================================================================
// Snapshot Wire Encoding Tests
// =============================================================================

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

#include "halbrain/error.hpp"
#include "halbrain/snapshot/wire.hpp"

using namespace halbrain;
using namespace halbrain::snapshot;

class WireTest : public ::testing::Test {
protected:
    static std::string bytes(std::initializer_list<int> values) {
        std::string out;
        for (int v : values) out.push_back(static_cast<char>(v));
        return out;
    }
};

TEST_F(WireTest, CompactIntegers) {
    PackWriter w;
    w.write_int(5);
    w.write_int(-1);
    w.write_int(200);
    w.write_int(-100);
    w.write_int(70000);
    EXPECT_EQ(w.bytes(), bytes({0x05, 0xff, 0xcc, 0xc8, 0xd0, 0x9c, 0xce, 0x00, 0x01, 0x11, 0x70}));
}

TEST_F(WireTest, IntegerWidthBoundaries) {
    const int64_t values[] = {
        0, 127, 128, 255, 256, 65535, 65536, 4294967295LL, 4294967296LL,
        -32, -33, -128, -129, -32768, -32769,
        std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max(),
    };
    PackWriter w;
    for (int64_t v : values) w.write_int(v);

    PackReader r(w.bytes());
    for (int64_t v : values) {
        EXPECT_EQ(r.read_int(), v);
    }
    EXPECT_TRUE(r.at_end());
}

TEST_F(WireTest, StringsAndContainers) {
    PackWriter w;
    w.write_string("abc");
    w.write_array_header(20);
    w.write_map_header(2);
    w.write_bool(true);
    w.write_nil();
    EXPECT_EQ(w.bytes(), bytes({0xa3, 'a', 'b', 'c', 0xdc, 0x00, 0x14, 0x82, 0xc3, 0xc0}));
}

TEST_F(WireTest, LongStringUsesLengthPrefix) {
    std::string text(300, 'z');
    PackWriter w;
    w.write_string(text);
    EXPECT_EQ(w.bytes().substr(0, 3), bytes({0xda, 0x01, 0x2c}));

    PackReader r(w.bytes());
    EXPECT_EQ(r.read_string(), text);
}

TEST_F(WireTest, PeekType) {
    PackReader r(bytes({0x91, 0xc0}));
    EXPECT_EQ(r.peek_type(), WireType::Array);
    EXPECT_EQ(r.read_array_header(), 1u);
    EXPECT_EQ(r.peek_type(), WireType::Nil);
}

TEST_F(WireTest, NilReadsAsEmptyArray) {
    PackReader r(bytes({0xc0, 0x92, 0x01, 0x02}));
    EXPECT_EQ(r.read_array_header_or_nil(), 0u);
    EXPECT_EQ(r.read_array_header_or_nil(), 2u);
    EXPECT_FALSE(r.read_nil());
    EXPECT_EQ(r.read_int(), 1);
}

TEST_F(WireTest, SkipsValuesItDoesNotRead) {
    // {"f": 1.5 (float64), "b": bin8[2], "x": fixext1, "n": [[1], {"k": "v"}]} then 7
    std::string data = bytes({0x84,
        0xa1, 'f', 0xcb, 0x3f, 0xf8, 0, 0, 0, 0, 0, 0,
        0xa1, 'b', 0xc4, 0x02, 0x10, 0x20,
        0xa1, 'x', 0xd4, 0x01, 0x7f,
        0xa1, 'n', 0x92, 0x91, 0x01, 0x81, 0xa1, 'k', 0xa1, 'v',
        0x07});
    PackReader r(data);
    r.skip();
    EXPECT_EQ(r.read_int(), 7);
    EXPECT_TRUE(r.at_end());
}

TEST_F(WireTest, TruncatedInputFails) {
    PackReader r(bytes({0xa5, 'a', 'b'}));
    try {
        r.read_string();
        FAIL() << "expected SnapshotFormatError";
    } catch (const SnapshotFormatError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MALFORMED_SNAPSHOT);
    }

    PackReader empty("");
    EXPECT_THROW(empty.read_int(), SnapshotFormatError);
}

TEST_F(WireTest, TypeMismatchFails) {
    PackReader r(bytes({0xa1, 'x'}));
    EXPECT_THROW(r.read_int(), SnapshotFormatError);
    EXPECT_THROW(r.read_bool(), SnapshotFormatError);
    EXPECT_THROW(r.read_map_header(), SnapshotFormatError);
    EXPECT_EQ(r.read_string(), "x");
}

TEST_F(WireTest, ReservedByteFails) {
    PackReader r(bytes({0xc1}));
    EXPECT_THROW(r.peek_type(), SnapshotFormatError);
    EXPECT_THROW(r.skip(), SnapshotFormatError);
}
