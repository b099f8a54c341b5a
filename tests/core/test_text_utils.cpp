// test_text_utils.cpp — тесты TextUtils

#include <gtest/gtest.h>
#include "thinkara/TextUtils.h"

using namespace Thinkara;

// ═══════════════════════════════════════════════════════════
// Пробелы и слова
// ═══════════════════════════════════════════════════════════

TEST(TextUtilsTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(TextUtils::trim("  hello world \n\t"), "hello world");
    EXPECT_EQ(TextUtils::trim("   "), "");
    EXPECT_EQ(TextUtils::trim(""), "");
}

TEST(TextUtilsTest, CollapseWhitespace) {
    EXPECT_EQ(TextUtils::collapseWhitespace("  a \n\n b\t\tc  "), "a b c");
}

TEST(TextUtilsTest, NonWhitespaceLength) {
    EXPECT_EQ(TextUtils::nonWhitespaceLength(" a b\nc "), 3u);
    EXPECT_EQ(TextUtils::nonWhitespaceLength(" \n\t "), 0u);
}

TEST(TextUtilsTest, CountWords) {
    EXPECT_EQ(TextUtils::countWords(""), 0u);
    EXPECT_EQ(TextUtils::countWords("one"), 1u);
    EXPECT_EQ(TextUtils::countWords("  one two\nthree\tfour  "), 4u);
}

// ═══════════════════════════════════════════════════════════
// Время чтения
// ═══════════════════════════════════════════════════════════

TEST(TextUtilsTest, ReadTimeRoundsUp) {
    EXPECT_EQ(TextUtils::estimateReadTime(500, 200), 3);
    EXPECT_EQ(TextUtils::estimateReadTime(400, 200), 2);
    EXPECT_EQ(TextUtils::estimateReadTime(401, 200), 3);
}

TEST(TextUtilsTest, ReadTimeIsAtLeastOneMinute) {
    EXPECT_EQ(TextUtils::estimateReadTime(0, 200), 1);
    EXPECT_EQ(TextUtils::estimateReadTime(3, 200), 1);
}

// ═══════════════════════════════════════════════════════════
// Отрывок
// ═══════════════════════════════════════════════════════════

TEST(TextUtilsTest, ExcerptOfShortTextGetsEllipsis) {
    EXPECT_EQ(TextUtils::makeExcerpt("Hello   world", 280), "Hello world...");
}

TEST(TextUtilsTest, ExcerptOfEmptyTextIsEmpty) {
    EXPECT_EQ(TextUtils::makeExcerpt("  \n ", 280), "");
}

TEST(TextUtilsTest, ExcerptCutsAtWordBoundary) {
    std::string text;
    for (int i = 0; i < 100; ++i) {
        text += "lorem ipsum ";
    }

    std::string excerpt = TextUtils::makeExcerpt(text, 280);
    ASSERT_GE(excerpt.size(), 3u);
    EXPECT_LE(excerpt.size(), 283u);
    EXPECT_EQ(excerpt.substr(excerpt.size() - 3), "...");

    // Последнее слово целое
    std::string body = excerpt.substr(0, excerpt.size() - 3);
    EXPECT_TRUE(body.size() >= 5);
    std::string lastWord = body.substr(body.rfind(' ') + 1);
    EXPECT_TRUE(lastWord == "lorem" || lastWord == "ipsum") << lastWord;
}

TEST(TextUtilsTest, ExcerptCountsUtf8Characters) {
    // 200 кириллических символов = 400 байт, лимит 280 символов не достигнут
    std::string text;
    for (int i = 0; i < 40; ++i) {
        text += "слово ";
    }
    std::string excerpt = TextUtils::makeExcerpt(text, 280);
    EXPECT_EQ(excerpt, TextUtils::trim(text) + "...");
}

TEST(TextUtilsTest, ExcerptNeverSplitsMultibyteCharacter) {
    std::string text;
    for (int i = 0; i < 300; ++i) {
        text += "ж";
    }
    std::string excerpt = TextUtils::makeExcerpt(text, 10);
    EXPECT_EQ(excerpt, std::string("жжжжжжжжжж") + "...");
}

// ═══════════════════════════════════════════════════════════
// Base64
// ═══════════════════════════════════════════════════════════

TEST(TextUtilsTest, Base64Encode) {
    const std::string man = "Man";
    EXPECT_EQ(TextUtils::base64Encode(reinterpret_cast<const uint8_t*>(man.data()), man.size()), "TWFu");

    const std::string ma = "Ma";
    EXPECT_EQ(TextUtils::base64Encode(reinterpret_cast<const uint8_t*>(ma.data()), ma.size()), "TWE=");

    EXPECT_EQ(TextUtils::base64Encode(nullptr, 0), "");
}

TEST(TextUtilsTest, DataUrl) {
    EXPECT_EQ(TextUtils::toDataUrl("image/png", "Man"), "data:image/png;base64,TWFu");
    EXPECT_EQ(TextUtils::toDataUrl("image/gif", ""), "data:image/gif;base64,");
}

TEST(TextUtilsTest, ToLower) {
    EXPECT_EQ(TextUtils::toLower("HeLLo-World"), "hello-world");
}
