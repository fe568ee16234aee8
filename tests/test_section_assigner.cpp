#include <gtest/gtest.h>
#include <layout_chunker/section_assigner.h>

using namespace layout_chunker;

TEST(SectionAssignerTest, NewSectionAtPivotLevelChange) {
    HeadingLevels headings{{0, 2, 1, 2, 0}, 1};
    EXPECT_EQ(assign_sections(headings), (std::vector<int>{0, 0, 1, 1, 2}));
}

TEST(SectionAssignerTest, RepeatedLevelStaysInSection) {
    HeadingLevels headings{{0, 0, 0}, 0};
    EXPECT_EQ(assign_sections(headings), (std::vector<int>{0, 0, 0}));
}

TEST(SectionAssignerTest, BodyLevelsNeverOpenSections) {
    HeadingLevels headings{{3, 4, 3, 4}, 2};
    EXPECT_EQ(assign_sections(headings), (std::vector<int>{0, 0, 0, 0}));
}

TEST(SectionAssignerTest, EmptyInput) {
    EXPECT_TRUE(assign_sections(HeadingLevels{}).empty());
}

TEST(SectionAssignerTest, IdsStartAtZeroAndNeverDecrease) {
    HeadingLevels headings{{1, 7, 2, 7, 7, 1, 2, 2, 7, 1, 7}, 2};
    auto ids = assign_sections(headings);

    ASSERT_EQ(ids.size(), headings.levels.size());
    EXPECT_EQ(ids.front(), 0);
    for (size_t i = 1; i < ids.size(); ++i) {
        EXPECT_GE(ids[i], ids[i - 1]);
        EXPECT_LE(ids[i], ids[i - 1] + 1);
    }
}
