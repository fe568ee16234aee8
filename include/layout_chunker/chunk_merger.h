#pragma once

#include "layout_chunker/tokenizer.h"
#include "layout_chunker/types.h"
#include <string>
#include <vector>

namespace layout_chunker {

// A block or a table on its way into a chunk
struct MergeItem {
    std::string text;
    int section_id = 0;
    Geometry geometry;
};

// Finalized chunk; text carries the embedded position tags
struct Chunk {
    std::string text;
    size_t token_count = 0;
    int section_id = 0;
    Geometry geometry;      // fragments of every merged item, in merge order
};

// Merge thresholds. Small chunks always absorb the next item; chunks under
// max_tokens absorb items of the same section or tables.
struct MergeOptions {
    size_t min_tokens = 32;
    size_t max_tokens = 1024;
};

class ChunkMerger {
public:
    explicit ChunkMerger(const Tokenizer& tokenizer, const MergeOptions& options = MergeOptions{});

    // Sorts by reading order and merges greedily. When every item has section
    // id 0 nothing is merged: one chunk per item.
    std::vector<Chunk> merge(std::vector<MergeItem> items) const;

    // Stable sort on (page, top, left) of the first fragment
    static void sort_reading_order(std::vector<MergeItem>& items);

private:
    const Tokenizer& tokenizer_;
    MergeOptions options_;
};

} // namespace layout_chunker
