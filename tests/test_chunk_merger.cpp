#include <gtest/gtest.h>
#include <layout_chunker/chunk_merger.h>
#include <layout_chunker/geometry.h>
#include "test_helpers.h"

using namespace layout_chunker;
using layout_chunker::test_support::WordTokenizer;
using layout_chunker::test_support::words;

class ChunkMergerTest : public ::testing::Test {
protected:
    MergeItem item(const std::string& text, int section, int page, double top, double left = 10.0) {
        return MergeItem{text, section, {{page, left, left + 100.0, top, top + 10.0}}};
    }

    WordTokenizer tokenizer_;
};

TEST_F(ChunkMergerTest, EmptyInput) {
    ChunkMerger merger(tokenizer_);
    EXPECT_TRUE(merger.merge({}).empty());
}

TEST_F(ChunkMergerTest, ThresholdIsStrictlyBelow32) {
    ChunkMerger merger(tokenizer_);

    // A chunk at exactly 32 tokens no longer absorbs a foreign section
    auto at_threshold = merger.merge({item(words(32), 1, 1, 10.0), item(words(32), 2, 1, 20.0)});
    ASSERT_EQ(at_threshold.size(), 2u);
    EXPECT_EQ(at_threshold[0].token_count, 32u);
    EXPECT_EQ(at_threshold[1].token_count, 32u);

    // One token less and it still does
    auto below = merger.merge({item(words(31), 1, 1, 10.0), item(words(32), 2, 1, 20.0)});
    ASSERT_EQ(below.size(), 1u);
    EXPECT_EQ(below[0].token_count, 63u);
}

TEST_F(ChunkMergerTest, SameSectionMergesUntilMaxTokens) {
    MergeOptions options;
    options.max_tokens = 100;
    ChunkMerger merger(tokenizer_, options);

    auto chunks = merger.merge({
        item(words(60), 1, 1, 10.0),
        item(words(39), 1, 1, 20.0),
        item(words(5), 1, 1, 30.0),
        item(words(5), 1, 1, 40.0),
    });

    // 60 + 39 = 99 < 100 absorbs the third item; 104 closes the chunk
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].token_count, 104u);
    EXPECT_EQ(chunks[1].token_count, 5u);
}

TEST_F(ChunkMergerTest, DifferentSectionStartsNewChunk) {
    ChunkMerger merger(tokenizer_);

    auto chunks = merger.merge({item(words(40), 1, 1, 10.0), item(words(40), 2, 1, 20.0)});

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].section_id, 1);
    EXPECT_EQ(chunks[1].section_id, 2);
}

TEST_F(ChunkMergerTest, TablesMergeIntoAnySection) {
    ChunkMerger merger(tokenizer_);

    auto chunks = merger.merge({
        item(words(40, "a"), 1, 1, 10.0),
        item("<table><tr><td>t</td></tr></table>", kTableSectionId, 1, 20.0),
        item(words(40, "b"), 2, 1, 30.0),
    });

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_NE(chunks[0].text.find("<table>"), std::string::npos);
    EXPECT_EQ(chunks[1].text.find("<table>"), std::string::npos);
}

TEST_F(ChunkMergerTest, TablesDoNotRedefineCurrentSection) {
    ChunkMerger merger(tokenizer_);

    auto chunks = merger.merge({
        item(words(40, "a"), 1, 1, 10.0),
        item("<table></table>", kTableSectionId, 1, 20.0),
        item(words(40, "c"), 1, 1, 30.0),
    });

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].section_id, 1);
}

TEST_F(ChunkMergerTest, AbsorbedItemRedefinesCurrentSection) {
    ChunkMerger merger(tokenizer_);

    // The short opening chunk absorbs section 2, which then becomes current,
    // so the next section 2 item joins the same chunk
    auto chunks = merger.merge({
        item(words(10, "a"), 1, 1, 10.0),
        item(words(40, "b"), 2, 1, 20.0),
        item(words(40, "c"), 2, 1, 30.0),
    });

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].token_count, 90u);
    EXPECT_EQ(chunks[0].section_id, 1);
}

TEST_F(ChunkMergerTest, AllZeroSectionsKeepEveryItem) {
    ChunkMerger merger(tokenizer_);

    std::vector<MergeItem> items = {
        item("page one", 0, 1, 0.0),
        item("page two", 0, 2, 0.0),
        item("page three", 0, 3, 0.0),
    };
    auto chunks = merger.merge(items);

    ASSERT_EQ(chunks.size(), items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(chunks[i].text, items[i].text + geometry_tags(items[i].geometry));
    }
}

TEST_F(ChunkMergerTest, EmbedsTagsAndJoinsWithNewline) {
    ChunkMerger merger(tokenizer_);

    auto chunks = merger.merge({
        MergeItem{"alpha", 1, {{1, 10.0, 20.0, 30.0, 40.0}}},
        MergeItem{"beta", 1, {{1, 10.0, 20.0, 50.0, 60.0}}},
    });

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].text,
              "alpha@@1\t10.0\t20.0\t30.0\t40.0##\nbeta@@1\t10.0\t20.0\t50.0\t60.0##");
    EXPECT_EQ(chunks[0].geometry.size(), 2u);
}

TEST_F(ChunkMergerTest, ItemsWithoutGeometryAddNoTag) {
    ChunkMerger merger(tokenizer_);

    auto chunks = merger.merge({MergeItem{"plain", 1, {Position{}}}, MergeItem{"text", 1, {}}});

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].text, "plain\ntext");
}

TEST_F(ChunkMergerTest, SortsByPageThenTopThenLeft) {
    std::vector<MergeItem> items = {
        item("third", 1, 2, 5.0),
        item("second-right", 1, 1, 50.0, 300.0),
        item("first", 1, 1, 10.0),
        item("second-left", 1, 1, 50.0, 20.0),
    };

    ChunkMerger::sort_reading_order(items);

    ASSERT_EQ(items.size(), 4u);
    EXPECT_EQ(items[0].text, "first");
    EXPECT_EQ(items[1].text, "second-left");
    EXPECT_EQ(items[2].text, "second-right");
    EXPECT_EQ(items[3].text, "third");
}

TEST_F(ChunkMergerTest, EqualKeysKeepInputOrder) {
    std::vector<MergeItem> items = {
        MergeItem{"a", 1, {}},
        MergeItem{"b", 1, {}},
        MergeItem{"c", 1, {}},
    };

    ChunkMerger::sort_reading_order(items);

    EXPECT_EQ(items[0].text, "a");
    EXPECT_EQ(items[1].text, "b");
    EXPECT_EQ(items[2].text, "c");
}

TEST_F(ChunkMergerTest, ChunksAreContiguousRunsOfSortedItems) {
    std::vector<MergeItem> items;
    for (int i = 0; i < 40; ++i) {
        int section = i / 7;
        int page = 1 + (39 - i) / 10;
        size_t length = 5 + (i * 13) % 50;
        items.push_back(item(words(length, "x" + std::to_string(i)), section, page, (i * 17) % 100));
    }

    std::vector<MergeItem> sorted = items;
    ChunkMerger::sort_reading_order(sorted);

    ChunkMerger merger(tokenizer_);
    auto chunks = merger.merge(items);

    std::string expected;
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i > 0) expected += "\n";
        expected += sorted[i].text + geometry_tags(sorted[i].geometry);
    }

    std::string actual;
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (i > 0) actual += "\n";
        actual += chunks[i].text;
    }

    EXPECT_EQ(actual, expected);
    EXPECT_LT(chunks.size(), items.size());
}
