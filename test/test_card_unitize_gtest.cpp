// test_card_unitize_gtest.cpp - Unit tests for text unitization
//
// Tests card_unitize.hpp:
// - Paragraph and sentence splitting
// - Word packing and hard cuts for long chunks
// - Punctuation-aware cuts for unspaced text
// - Unit stream ordering and the width bound

#include <gtest/gtest.h>
#include "cardpage/card_unitize.hpp"
#include "cardpage/card_width.hpp"

using namespace cardpage;

typedef std::vector<std::string> Strings;

// ============================================================================
// Paragraphs
// ============================================================================

TEST(CardUnitizeTest, SplitParagraphsNormalizesLineEndings) {
    EXPECT_EQ(split_paragraphs("  a\r\n\r\nb\rc \n\n\n "), (Strings{"a", "b", "c"}));
}

TEST(CardUnitizeTest, SplitParagraphsOfBlankText) {
    EXPECT_TRUE(split_paragraphs("").empty());
    EXPECT_TRUE(split_paragraphs(" \n\n\t ").empty());
}

TEST(CardUnitizeTest, TrimHandlesUnicodeSpaces) {
    EXPECT_EQ(trim_text("\xE3\x80\x80" "abc\xC2\xA0"), "abc");   // U+3000, U+00A0
    EXPECT_EQ(trim_text("   "), "");
}

// ============================================================================
// Sentences
// ============================================================================

TEST(CardUnitizeTest, SplitSentences) {
    EXPECT_EQ(split_sentences("Hello world. How are you? Fine!"),
              (Strings{"Hello world.", "How are you?", "Fine!"}));
}

TEST(CardUnitizeTest, TerminalRunsStayTogether) {
    EXPECT_EQ(split_sentences("Wait... what?!"), (Strings{"Wait...", "what?!"}));
}

TEST(CardUnitizeTest, FullWidthTerminals) {
    EXPECT_EQ(split_sentences("你好。世界！"), (Strings{"你好。", "世界！"}));
}

TEST(CardUnitizeTest, SentenceWithoutTerminal) {
    EXPECT_EQ(split_sentences("no terminal"), (Strings{"no terminal"}));
}

TEST(CardUnitizeTest, LeadingTerminalsJoinFirstChunk) {
    EXPECT_EQ(split_sentences("...leading"), (Strings{"...leading"}));
}

// ============================================================================
// Long Chunks
// ============================================================================

TEST(CardUnitizeTest, ShortChunkIsUntouched) {
    EXPECT_EQ(split_long_chunk("short", 20), (Strings{"short"}));
}

TEST(CardUnitizeTest, WordsArePackedGreedily) {
    EXPECT_EQ(split_long_chunk("aaaa bbbb cccc", 5.0f), (Strings{"aaaa bbbb", "cccc"}));
}

TEST(CardUnitizeTest, OversizedWordIsHardCut) {
    EXPECT_EQ(split_long_chunk("x abcdefghij", 3.0f),
              (Strings{"x", "abc", "def", "ghi", "j"}));
}

TEST(CardUnitizeTest, UnspacedTextCutByWidth) {
    EXPECT_EQ(split_long_chunk("一二三四五六七八九十", 4.0f),
              (Strings{"一二三四", "五六七八", "九十"}));
}

TEST(CardUnitizeTest, PrefersLatePunctuationBreak) {
    EXPECT_EQ(split_long_chunk("一二三，四五六七八", 5.0f),
              (Strings{"一二三，", "四五六七八"}));
}

TEST(CardUnitizeTest, IgnoresEarlyPunctuationBreak) {
    EXPECT_EQ(split_long_chunk("一，二三四五六七", 5.0f),
              (Strings{"一，二三四", "五六七"}));
}

TEST(CardUnitizeTest, TinyBudgetStillAdvances) {
    Strings pieces = split_long_chunk("中文字", 0.5f);
    EXPECT_EQ(pieces, (Strings{"中", "文", "字"}));
}

// ============================================================================
// Unit Stream
// ============================================================================

TEST(CardUnitizeTest, UnitsWithParagraphBreaks) {
    std::vector<Unit> units = unitize("Para one. Second.\n\nPara two", 100);
    ASSERT_EQ(units.size(), 4u);
    EXPECT_EQ(units[0], Unit::chunk("Para one."));
    EXPECT_EQ(units[1], Unit::chunk("Second."));
    EXPECT_EQ(units[2], Unit::paragraph_break());
    EXPECT_EQ(units[3], Unit::chunk("Para two"));
}

TEST(CardUnitizeTest, NoUnitsForBlankText) {
    EXPECT_TRUE(unitize("", 10).empty());
    EXPECT_TRUE(unitize("   \n\n  ", 10).empty());
}

TEST(CardUnitizeTest, BreaksOnlyBetweenParagraphs) {
    std::vector<Unit> units = unitize("\n\na\n\n\n\nb\n\n", 100);
    ASSERT_EQ(units.size(), 3u);
    EXPECT_FALSE(units.front().is_break());
    EXPECT_TRUE(units[1].is_break());
    EXPECT_FALSE(units.back().is_break());
}

TEST(CardUnitizeTest, UnitsRespectWidthBudget) {
    std::string text =
        "这是一个很长的段落，没有任何空格但是有一些标点符号，用来测试按宽度切分的逻辑是否正确。"
        "Then some English follows with quite a few words in it to exercise the packer. "
        "Supercalifragilisticexpialidocious is long.\n\n"
        "第二段落也很长很长很长很长很长很长很长很长很长很长很长很长很长很长很长很长。";
    const float budget = 12.0f;
    for (const Unit& unit : unitize(text, budget)) {
        if (unit.is_break()) continue;
        EXPECT_FALSE(unit.text.empty());
        EXPECT_LE(estimate_width(unit.text), budget) << unit.text;
    }
}

TEST(CardUnitizeTest, StreamMatchesEagerList) {
    const char* text = "One. Two!\nThree? Four.";
    std::vector<Unit> eager = unitize(text, 3.0f);
    UnitStream stream(text, 3.0f);
    Unit unit;
    size_t i = 0;
    while (stream.next(unit)) {
        ASSERT_LT(i, eager.size());
        EXPECT_EQ(unit, eager[i]);
        i++;
    }
    EXPECT_EQ(i, eager.size());
}
