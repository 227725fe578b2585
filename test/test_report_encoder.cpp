#include <gtest/gtest.h>
#include <vector>
#include "report_encoder.h"

using namespace report_encoder;
using namespace keycode_table;

TEST(ReportEncoder, ReleaseFrameIsAllZero) {
    ReportFrame f = ReportFrame::release();
    EXPECT_TRUE(f.is_release());
    for (uint8_t b : f.bytes()) EXPECT_EQ(b, 0);
    EXPECT_EQ(f.to_vector().size(), REPORT_SIZE);
}

TEST(ReportEncoder, PressFrameLayout) {
    ReportFrame f(MOD_LEFT_SHIFT, KEY_A);
    EXPECT_EQ(f.bytes()[0], MOD_LEFT_SHIFT);
    EXPECT_EQ(f.bytes()[1], 0);
    EXPECT_EQ(f.bytes()[2], KEY_A);
    for (size_t i = 3; i < REPORT_SIZE; ++i) EXPECT_EQ(f.bytes()[i], 0);
    EXPECT_FALSE(f.is_release());
}

TEST(ReportEncoder, EachCharacterIsPressThenRelease) {
    std::vector<ReportFrame> frames;
    ASSERT_TRUE(encode(U'a', Layout::US, frames));
    ASSERT_TRUE(encode(U'b', Layout::US, frames));
    ASSERT_EQ(frames.size(), 4u);
    EXPECT_EQ(frames[0], ReportFrame(MOD_NONE, KEY_A));
    EXPECT_TRUE(frames[1].is_release());
    EXPECT_EQ(frames[2], ReportFrame(MOD_NONE, KEY_A + 1));
    EXPECT_TRUE(frames[3].is_release());
}

TEST(ReportEncoder, ShiftedCharacter) {
    std::vector<ReportFrame> frames;
    ASSERT_TRUE(encode(U'A', Layout::US, frames));
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].modifiers(), MOD_LEFT_SHIFT);
    EXPECT_EQ(frames[0].usage(), KEY_A);
}

TEST(ReportEncoder, NewlineAndCarriageReturnAreEnter) {
    for (char32_t c : {U'\n', U'\r'}) {
        std::vector<ReportFrame> frames;
        ASSERT_TRUE(encode(c, Layout::DANISH, frames));
        ASSERT_EQ(frames.size(), 2u);
        EXPECT_EQ(frames[0], ReportFrame(MOD_NONE, KEY_ENTER));
        EXPECT_TRUE(frames[1].is_release());
    }
}

TEST(ReportEncoder, DeadKeySequenceReleasesBetweenStrokes) {
    std::vector<ReportFrame> frames;
    ASSERT_TRUE(encode(U'ü', Layout::DANISH, frames));
    ASSERT_EQ(frames.size(), 4u);
    EXPECT_EQ(frames[0], ReportFrame(MOD_NONE, 0x30));
    EXPECT_TRUE(frames[1].is_release());
    EXPECT_EQ(frames[2], ReportFrame(MOD_NONE, 0x18));
    EXPECT_TRUE(frames[3].is_release());
}

TEST(ReportEncoder, UnsupportedAppendsNothing) {
    std::vector<ReportFrame> frames;
    ASSERT_TRUE(encode(U'x', Layout::US, frames));
    EXPECT_FALSE(encode(U'☃', Layout::US, frames));
    EXPECT_EQ(frames.size(), 2u);
}
