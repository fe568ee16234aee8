#pragma once

#include "layout_chunker/types.h"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace layout_chunker {

// Per-block heading levels plus the level treated as section boundary.
// Lower levels are more important; anything above the pivot is body text.
struct HeadingLevels {
    std::vector<int> levels;
    int pivot_level = 0;
};

// Bullet/numbering families, in tie-break order
enum class BulletCategory : int {
    None = -1,
    ChineseLegal = 0,     // 第一编 / 第一章 / 第一节 / 第一条 / （一）
    DecimalNumbering,     // 第1章 / 1. / 1.1 / 1.1.1 / 1.1.1.1
    ChineseNumeral,       // 第一章 / 第一节 / 一、 / （一） / （1）
    EnglishHeading,       // PART ONE / Chapter IV / Section 3 / Article 7
    Markdown,             // # .. ######
    Outline               // I. / A. / 1. / a) / circled numbers
};

// Outline entries are trusted only above this fraction of the block count
constexpr double kOutlineDensityThreshold = 0.03;
// Minimum bigram similarity for a block to take an outline entry's level
constexpr double kOutlineSimilarityThreshold = 0.8;

class BulletClassifier {
public:
    // Category whose patterns match the most blocks; None when nothing matches
    static BulletCategory detect_category(const std::vector<Block>& blocks);

    // Index of the first pattern of the category matching the text, or -1
    static int match_level(BulletCategory category, const std::string& text);

    static int pattern_count(BulletCategory category);

    // Leading number forms that look like bullets but are not ("0.5", "3 个", "12....")
    static bool not_bullet(const std::string& text);

    // Title-labelled blocks that read like sentences are not titles
    static bool not_title(const std::string& text);
};

// Outline path: levels taken from the best matching outline entry
class OutlineMatcher {
public:
    explicit OutlineMatcher(std::vector<OutlineEntry> outline);
    HeadingLevels classify(const std::vector<Block>& blocks) const;

private:
    std::vector<OutlineEntry> outline_;
};

// Bullet path: levels from the most frequent bullet family
class BulletFrequency {
public:
    HeadingLevels classify(const std::vector<Block>& blocks) const;
};

using HeadingInference = std::variant<OutlineMatcher, BulletFrequency>;

// Chooses the outline path when the outline is dense enough
HeadingInference select_heading_inference(const std::vector<Block>& blocks,
                                          const std::optional<std::vector<OutlineEntry>>& outline);

// Runs the selected path and checks one level per block
HeadingLevels infer_heading_levels(const std::vector<Block>& blocks,
                                   const std::optional<std::vector<OutlineEntry>>& outline);

// Jaccard similarity of character-bigram sets; block bigrams are taken over
// its first min(len(outline), len(block)) characters.
double bigram_similarity(const std::string& outline_text, const std::string& block_text);

} // namespace layout_chunker
