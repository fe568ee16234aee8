#include "layout_chunker/chunk_merger.h"
#include "layout_chunker/geometry.h"
#include <algorithm>
#include <tuple>

namespace layout_chunker {

namespace {

// Running state of one merge pass
struct MergeState {
    std::vector<Chunk> chunks;
    size_t token_count = 0;
    int last_section_id = -2;
};

std::tuple<int, double, double> reading_key(const MergeItem& item) {
    if (item.geometry.empty()) {
        return {0, 0.0, 0.0};
    }
    const auto& first = item.geometry.front();
    return {first.page, first.top, first.left};
}

} // namespace

ChunkMerger::ChunkMerger(const Tokenizer& tokenizer, const MergeOptions& options)
    : tokenizer_(tokenizer), options_(options) {}

void ChunkMerger::sort_reading_order(std::vector<MergeItem>& items) {
    std::stable_sort(items.begin(), items.end(),
                     [](const MergeItem& a, const MergeItem& b) {
                         return reading_key(a) < reading_key(b);
                     });
}

std::vector<Chunk> ChunkMerger::merge(std::vector<MergeItem> items) const {
    MergeState state;
    if (items.empty()) {
        return state.chunks;
    }

    // Sources without sectioning (e.g. one vision transcript per page) keep
    // their own unit boundaries
    bool merging_disabled = std::all_of(items.begin(), items.end(),
                                        [](const MergeItem& item) { return item.section_id == 0; });

    sort_reading_order(items);

    for (const auto& item : items) {
        std::string tags = geometry_tags(item.geometry);
        size_t tokens = tokenizer_.count_tokens(item.text);

        bool should_merge = false;
        if (!merging_disabled && !state.chunks.empty()) {
            should_merge = state.token_count < options_.min_tokens ||
                           (state.token_count < options_.max_tokens &&
                            (item.section_id == state.last_section_id ||
                             item.section_id == kTableSectionId));
        }

        if (should_merge) {
            Chunk& open = state.chunks.back();
            open.text += "\n" + item.text + tags;
            state.token_count += tokens;
            open.token_count = state.token_count;
            open.geometry.insert(open.geometry.end(), item.geometry.begin(), item.geometry.end());
        } else {
            Chunk chunk;
            chunk.text = item.text + tags;
            chunk.token_count = tokens;
            chunk.section_id = item.section_id;
            chunk.geometry = item.geometry;
            state.chunks.push_back(std::move(chunk));
            state.token_count = tokens;
        }

        // Tables never redefine the current section
        if (item.section_id != kTableSectionId) {
            state.last_section_id = item.section_id;
        }
    }

    return state.chunks;
}

} // namespace layout_chunker
