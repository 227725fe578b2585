#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "pipe_cursor.h"

using pipe_cursor::PipeCursor;
using pipe_cursor::REPLACEMENT_CHAR;

namespace {

std::vector<char32_t> decode(PipeCursor& cur, const std::string& bytes) {
    std::vector<char32_t> out;
    cur.feed(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size(), out);
    return out;
}

} // namespace

TEST(PipeCursor, Ascii) {
    PipeCursor cur;
    EXPECT_EQ(decode(cur, "hi\n"), (std::vector<char32_t>{U'h', U'i', U'\n'}));
    EXPECT_EQ(cur.offset(), 3u);
}

TEST(PipeCursor, MultiByte) {
    PipeCursor cur;
    EXPECT_EQ(decode(cur, "\xC3\xA6\xE2\x82\xAC\xF0\x9F\x98\x80"),
              (std::vector<char32_t>{U'æ', U'€', 0x1F600}));
}

TEST(PipeCursor, SequenceSplitAcrossReads) {
    PipeCursor cur;
    EXPECT_TRUE(decode(cur, "\xE2").empty());
    EXPECT_TRUE(cur.has_partial());
    EXPECT_TRUE(decode(cur, "\x98").empty());
    EXPECT_EQ(decode(cur, "\x83z"), (std::vector<char32_t>{0x2603, U'z'}));
    EXPECT_FALSE(cur.has_partial());
    EXPECT_EQ(cur.offset(), 4u);
}

TEST(PipeCursor, StrayContinuationByte) {
    PipeCursor cur;
    EXPECT_EQ(decode(cur, "a\x80" "b"), (std::vector<char32_t>{U'a', REPLACEMENT_CHAR, U'b'}));
}

TEST(PipeCursor, TruncatedSequenceKeepsNextByte) {
    PipeCursor cur;
    EXPECT_EQ(decode(cur, "\xC3" "a"), (std::vector<char32_t>{REPLACEMENT_CHAR, U'a'}));
}

TEST(PipeCursor, OverlongSurrogateAndOutOfRange) {
    PipeCursor cur;
    EXPECT_EQ(decode(cur, "\xC0\xAF"), (std::vector<char32_t>{REPLACEMENT_CHAR, REPLACEMENT_CHAR}));
    EXPECT_EQ(decode(cur, "\xE0\x80\xAF"), (std::vector<char32_t>{REPLACEMENT_CHAR}));
    EXPECT_EQ(decode(cur, "\xED\xA0\x80"), (std::vector<char32_t>{REPLACEMENT_CHAR}));
    EXPECT_EQ(decode(cur, "\xF4\x90\x80\x80"), (std::vector<char32_t>{REPLACEMENT_CHAR}));
    EXPECT_EQ(decode(cur, "\xFF"), (std::vector<char32_t>{REPLACEMENT_CHAR}));
}

TEST(PipeCursor, ResetDropsPartial) {
    PipeCursor cur;
    decode(cur, "\xE2\x98");
    cur.reset();
    EXPECT_FALSE(cur.has_partial());
    EXPECT_EQ(decode(cur, "q"), (std::vector<char32_t>{U'q'}));
}
