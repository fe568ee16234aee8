#include <gtest/gtest.h>
#include <layout_chunker/text_utils.h>

using namespace layout_chunker;

namespace {
const std::string kReplacement = "\xEF\xBF\xBD";
}

TEST(TextUtilsTest, WideRoundTripKeepsMultibyteText) {
    std::string text = "Préface 第一章 \xF0\x9F\x93\x84";
    std::wstring wide = text::to_wide(text);

    ASSERT_EQ(wide.size(), 13u);
    EXPECT_EQ(wide[2], static_cast<wchar_t>(0xE9));
    EXPECT_EQ(wide[10], static_cast<wchar_t>(0x7AE0));
    EXPECT_EQ(wide[12], static_cast<wchar_t>(0x1F4C4));
    EXPECT_EQ(text::to_utf8(wide), text);
}

TEST(TextUtilsTest, TruncatedSequenceKeepsFollowingText) {
    std::wstring wide = text::to_wide("ok\xE4" "a");

    ASSERT_EQ(wide.size(), 4u);
    EXPECT_EQ(wide[2], static_cast<wchar_t>(0xFFFD));
    EXPECT_EQ(wide[3], L'a');
    EXPECT_EQ(text::to_utf8(wide), "ok" + kReplacement + "a");
}

TEST(TextUtilsTest, InvalidBytesDecodeOneReplacementEach) {
    EXPECT_EQ(text::to_utf8(text::to_wide("\xFF\xFE" "x")), kReplacement + kReplacement + "x");
    EXPECT_EQ(text::to_utf8(text::to_wide("end\xE4\xB8")), "end" + kReplacement + kReplacement);
}

TEST(TextUtilsTest, CollapseSpacesSurvivesInvalidBytes) {
    std::string collapsed = text::collapse_spaces("Title \xE4" "b");

    EXPECT_NE(collapsed.find('b'), std::string::npos);
    EXPECT_EQ(collapsed, "Title " + kReplacement + "b");
}

TEST(TextUtilsTest, CollapseSpacesMergesBlankRuns) {
    EXPECT_EQ(text::collapse_spaces("  a \t b\xE3\x80\x80\xE3\x80\x80" "c d  "), "a b c d");
}

TEST(TextUtilsTest, NormalizeHeadingReplacesIdeographicSpace) {
    EXPECT_EQ(text::normalize_heading("\xE3\x80\x80" "1.2\xE3\x80\x80" "Scope "), "1.2 Scope");
}

TEST(TextUtilsTest, Extensions) {
    EXPECT_EQ(text::file_extension("dir.v2/Report.PDF"), "pdf");
    EXPECT_EQ(text::file_extension("dir.v2/README"), "");
    EXPECT_EQ(text::strip_extension("manual.docx"), "manual");
    EXPECT_EQ(text::strip_extension("release-1.2"), "release-1.2");
}
