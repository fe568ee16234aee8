#include <gtest/gtest.h>
#include <layout_chunker/geometry.h>

using namespace layout_chunker;

TEST(GeometryTest, TagUsesOneDecimalWithTiesAwayFromZero) {
    Position pos{3, 10.25, 50.75, 100.0, 120.333};
    EXPECT_EQ(position_tag(pos), "@@3\t10.3\t50.8\t100.0\t120.3##");
}

TEST(GeometryTest, AllZeroPositionHasNoTag) {
    EXPECT_EQ(position_tag(Position{}), "");
}

TEST(GeometryTest, PageAloneIsNotZero) {
    Position pos{1, 0.0, 0.0, 0.0, 0.0};
    EXPECT_EQ(position_tag(pos), "@@1\t0.0\t0.0\t0.0\t0.0##");
}

TEST(GeometryTest, FragmentsJoinedWithTab) {
    Geometry geometry = {
        {1, 1.0, 2.0, 3.0, 4.0},
        {2, 5.0, 6.0, 7.0, 8.0},
    };
    EXPECT_EQ(geometry_tags(geometry),
              "@@1\t1.0\t2.0\t3.0\t4.0##\t@@2\t5.0\t6.0\t7.0\t8.0##");
}

TEST(GeometryTest, EmptyGeometryHasNoTags) {
    EXPECT_EQ(geometry_tags({}), "");
}

TEST(GeometryTest, FormatOneDecimal) {
    EXPECT_EQ(format_one_decimal(0.0), "0.0");
    EXPECT_EQ(format_one_decimal(0.04), "0.0");
    EXPECT_EQ(format_one_decimal(612.0), "612.0");
    EXPECT_EQ(format_one_decimal(-0.25), "-0.3");
    EXPECT_EQ(format_one_decimal(-3.14), "-3.1");
}
