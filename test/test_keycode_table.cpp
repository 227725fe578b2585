#include <gtest/gtest.h>
#include <map>
#include <vector>
#include "keycode_table.h"

using namespace keycode_table;

namespace {

std::vector<KeyStroke> strokes_of(const KeyMapEntry& e) {
    return std::vector<KeyStroke>(e.strokes, e.strokes + e.count);
}

bool stroke_less(const std::vector<KeyStroke>& a, const std::vector<KeyStroke>& b) {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
        [](const KeyStroke& x, const KeyStroke& y) {
            return x.modifiers != y.modifiers ? x.modifiers < y.modifiers : x.usage < y.usage;
        });
}

void expect_injective(Layout layout) {
    auto cmp = [](const std::vector<KeyStroke>& a, const std::vector<KeyStroke>& b) { return stroke_less(a, b); };
    std::map<std::vector<KeyStroke>, char32_t, decltype(cmp)> seen(cmp);
    for (const KeyMapEntry& e : entries(layout)) {
        auto res = seen.emplace(strokes_of(e), e.code_point);
        EXPECT_TRUE(res.second) << layout_name(layout) << ": U+" << std::hex
                                << static_cast<uint32_t>(e.code_point) << " and U+"
                                << static_cast<uint32_t>(res.first->second) << " share key strokes";
    }
}

} // namespace

TEST(KeycodeTable, UsCoversPrintableAscii) {
    for (char32_t c = 0x20; c <= 0x7E; ++c) {
        EXPECT_NE(lookup(Layout::US, c), nullptr) << "missing U+" << std::hex << static_cast<uint32_t>(c);
    }
}

TEST(KeycodeTable, DistinctCharactersHaveDistinctStrokes) {
    expect_injective(Layout::US);
    expect_injective(Layout::DANISH);
}

TEST(KeycodeTable, EntriesStayWithinReportMapRange) {
    for (Layout layout : {Layout::US, Layout::DANISH}) {
        for (const KeyMapEntry& e : entries(layout)) {
            ASSERT_GE(e.count, 1);
            ASSERT_LE(e.count, MAX_STROKES);
            for (uint8_t i = 0; i < e.count; ++i) {
                EXPECT_NE(e.strokes[i].usage, KEY_NONE);
                EXPECT_LE(e.strokes[i].usage, KEY_MAX_USAGE);
            }
        }
    }
}

TEST(KeycodeTable, LettersDigitsAndWhitespace) {
    const KeyMapEntry* a = lookup(Layout::US, U'a');
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->strokes[0], (KeyStroke{MOD_NONE, KEY_A}));

    const KeyMapEntry* big_z = lookup(Layout::DANISH, U'Z');
    ASSERT_NE(big_z, nullptr);
    EXPECT_EQ(big_z->strokes[0], (KeyStroke{MOD_LEFT_SHIFT, 0x1D}));

    EXPECT_EQ(lookup(Layout::US, U'0')->strokes[0].usage, KEY_0);
    EXPECT_EQ(lookup(Layout::US, U'1')->strokes[0].usage, KEY_1);
    EXPECT_EQ(lookup(Layout::DANISH, U' ')->strokes[0].usage, KEY_SPACE);
    EXPECT_EQ(lookup(Layout::DANISH, U'\t')->strokes[0].usage, KEY_TAB);
}

TEST(KeycodeTable, NewlineIsLeftToTheEncoder) {
    EXPECT_EQ(lookup(Layout::US, U'\n'), nullptr);
    EXPECT_EQ(lookup(Layout::DANISH, U'\n'), nullptr);
}

TEST(KeycodeTable, UsShiftedSymbols) {
    EXPECT_EQ(lookup(Layout::US, U'@')->strokes[0], (KeyStroke{MOD_LEFT_SHIFT, 0x1F}));
    EXPECT_EQ(lookup(Layout::US, U'"')->strokes[0], (KeyStroke{MOD_LEFT_SHIFT, 0x34}));
}

TEST(KeycodeTable, DanishLetters) {
    EXPECT_EQ(lookup(Layout::DANISH, U'æ')->strokes[0], (KeyStroke{MOD_NONE, 0x33}));
    EXPECT_EQ(lookup(Layout::DANISH, U'Ø')->strokes[0], (KeyStroke{MOD_LEFT_SHIFT, 0x34}));
    EXPECT_EQ(lookup(Layout::DANISH, U'å')->strokes[0], (KeyStroke{MOD_NONE, 0x2F}));
}

TEST(KeycodeTable, DanishAltGrAndShiftedDigits) {
    EXPECT_EQ(lookup(Layout::DANISH, U'@')->strokes[0], (KeyStroke{MOD_RIGHT_ALT, 0x1F}));
    EXPECT_EQ(lookup(Layout::DANISH, U'"')->strokes[0], (KeyStroke{MOD_LEFT_SHIFT, 0x1F}));
    EXPECT_EQ(lookup(Layout::DANISH, U'€')->strokes[0], (KeyStroke{MOD_RIGHT_ALT, 0x22}));
    EXPECT_EQ(lookup(Layout::DANISH, U'\\')->strokes[0], (KeyStroke{MOD_RIGHT_ALT, KEY_NON_US_BSL}));
}

TEST(KeycodeTable, DanishDeadKeyComposition) {
    const KeyMapEntry* e = lookup(Layout::DANISH, U'é');
    ASSERT_NE(e, nullptr);
    ASSERT_EQ(e->count, 2);
    EXPECT_EQ(e->strokes[0], (KeyStroke{MOD_NONE, 0x2E}));
    EXPECT_EQ(e->strokes[1], (KeyStroke{MOD_NONE, 0x08}));

    const KeyMapEntry* caret = lookup(Layout::DANISH, U'^');
    ASSERT_NE(caret, nullptr);
    ASSERT_EQ(caret->count, 2);
    EXPECT_EQ(caret->strokes[0], (KeyStroke{MOD_LEFT_SHIFT, 0x30}));
    EXPECT_EQ(caret->strokes[1], (KeyStroke{MOD_NONE, KEY_SPACE}));

    const KeyMapEntry* n_tilde = lookup(Layout::DANISH, U'Ñ');
    ASSERT_NE(n_tilde, nullptr);
    EXPECT_EQ(n_tilde->strokes[0], (KeyStroke{MOD_RIGHT_ALT, 0x30}));
    EXPECT_EQ(n_tilde->strokes[1], (KeyStroke{MOD_LEFT_SHIFT, 0x11}));
}

TEST(KeycodeTable, UnsupportedCodePoints) {
    EXPECT_EQ(lookup(Layout::US, U'æ'), nullptr);
    EXPECT_EQ(lookup(Layout::DANISH, U'☃'), nullptr);
    EXPECT_EQ(lookup(Layout::DANISH, 0xFFFD), nullptr);
    EXPECT_EQ(lookup(Layout::US, 0x07), nullptr);
}

TEST(KeycodeTable, ParseLayout) {
    Layout l = Layout::US;
    EXPECT_TRUE(parse_layout("DA", l));
    EXPECT_EQ(l, Layout::DANISH);
    EXPECT_TRUE(parse_layout("us", l));
    EXPECT_EQ(l, Layout::US);
    EXPECT_TRUE(parse_layout("danish", l));
    EXPECT_EQ(l, Layout::DANISH);
    EXPECT_FALSE(parse_layout("de", l));
    EXPECT_STREQ(layout_name(Layout::DANISH), "da");
}
