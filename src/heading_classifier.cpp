#include "layout_chunker/heading_classifier.h"
#include "layout_chunker/text_utils.h"
#include <algorithm>
#include <regex>
#include <set>
#include <utility>

namespace layout_chunker {

namespace {

using PatternList = std::vector<std::wregex>;

std::wregex pattern(const wchar_t* expr) {
    return std::wregex(expr, std::regex_constants::ECMAScript);
}

// Patterns per category, ordered from the most to the least important level.
// Indexed by static_cast<int>(BulletCategory).
const std::vector<PatternList>& bullet_patterns() {
    static const std::vector<PatternList> patterns = {
        {   // ChineseLegal
            pattern(L"第[零一二三四五六七八九十百0-9]+(分?编|部分)"),
            pattern(L"第[零一二三四五六七八九十百0-9]+章"),
            pattern(L"第[零一二三四五六七八九十百0-9]+节"),
            pattern(L"第[零一二三四五六七八九十百0-9]+条"),
            pattern(L"[\\(（][零一二三四五六七八九十百]+[\\)）]"),
        },
        {   // DecimalNumbering
            pattern(L"第[0-9]+章"),
            pattern(L"第[0-9]+节"),
            pattern(L"[0-9]{1,2}[\\. 、](?![0-9])"),
            pattern(L"[0-9]{1,2}\\.[0-9]{1,2}(\\.(?![0-9])|(?![0-9.a-zA-Z/%~-]))"),
            pattern(L"[0-9]{1,2}\\.[0-9]{1,2}\\.[0-9]{1,2}(\\.(?![0-9])|(?![0-9.]))"),
            pattern(L"[0-9]{1,2}\\.[0-9]{1,2}\\.[0-9]{1,2}\\.[0-9]{1,2}"),
        },
        {   // ChineseNumeral
            pattern(L"第[零一二三四五六七八九十百0-9]+章"),
            pattern(L"第[零一二三四五六七八九十百0-9]+节"),
            pattern(L"[零一二三四五六七八九十百]+[ 、]"),
            pattern(L"[\\(（][零一二三四五六七八九十百]+[\\)）]"),
            pattern(L"[\\(（][0-9]{1,2}[\\)）]"),
        },
        {   // EnglishHeading
            pattern(L"PART (ONE|TWO|THREE|FOUR|FIVE|SIX|SEVEN|EIGHT|NINE|TEN)"),
            pattern(L"Chapter ([IVXLC]+|[0-9]+)"),
            pattern(L"Section [0-9]+"),
            pattern(L"Article [0-9]+"),
        },
        {   // Markdown
            pattern(L"#[^#]"),
            pattern(L"##[^#]"),
            pattern(L"###[^#]"),
            pattern(L"####[^#]"),
            pattern(L"#####[^#]"),
            pattern(L"######[^#]"),
        },
        {   // Outline
            pattern(L"[IVXLC]+\\.\\s"),
            pattern(L"[A-Z]\\.\\s"),
            pattern(L"[0-9]{1,2}\\.\\s"),
            pattern(L"[a-z][\\.\\)]\\s"),
            pattern(L"[\u2460-\u2473]"),
        },
    };
    return patterns;
}

bool starts_with(const std::wregex& re, const std::wstring& text) {
    return std::regex_search(text, re, std::regex_constants::match_continuous);
}

int category_index(BulletCategory category) {
    return static_cast<int>(category);
}

std::set<std::wstring> bigrams(const std::wstring& text, size_t length) {
    std::set<std::wstring> grams;
    length = std::min(length, text.size());
    for (size_t i = 0; i + 1 < length; ++i) {
        grams.insert(text.substr(i, 2));
    }
    return grams;
}

} // namespace

bool BulletClassifier::not_bullet(const std::string& text) {
    static const std::vector<std::wregex> excluded = {
        pattern(L"0"),
        pattern(L"[0-9]+ +[0-9~个只-]"),
        pattern(L"[0-9]+\\.{2,}"),
    };
    std::wstring wide = text::trim(text::to_wide(text));
    for (const auto& re : excluded) {
        if (starts_with(re, wide)) return true;
    }
    return false;
}

bool BulletClassifier::not_title(const std::string& text) {
    static const std::wregex article = pattern(L"第[零一二三四五六七八九十百0-9]+条");
    static const std::wregex punctuation = pattern(L"[,;，。；！!]");

    std::wstring wide = text::to_wide(text);
    if (starts_with(article, wide)) {
        return false;
    }
    if (text::word_count(text) > 12 ||
        (text.find(' ') == std::string::npos && wide.size() >= 32)) {
        return true;
    }
    return std::regex_search(wide, punctuation);
}

int BulletClassifier::pattern_count(BulletCategory category) {
    if (category == BulletCategory::None) return 0;
    return static_cast<int>(bullet_patterns()[category_index(category)].size());
}

int BulletClassifier::match_level(BulletCategory category, const std::string& text) {
    if (category == BulletCategory::None) return -1;

    std::wstring wide = text::trim(text::to_wide(text));
    const auto& patterns = bullet_patterns()[category_index(category)];
    for (size_t j = 0; j < patterns.size(); ++j) {
        if (starts_with(patterns[j], wide)) {
            return static_cast<int>(j);
        }
    }
    return -1;
}

BulletCategory BulletClassifier::detect_category(const std::vector<Block>& blocks) {
    const auto& patterns = bullet_patterns();
    std::vector<int> hits(patterns.size(), 0);

    for (const auto& block : blocks) {
        if (not_bullet(block.text)) continue;
        std::wstring wide = text::trim(text::to_wide(block.text));

        for (size_t i = 0; i < patterns.size(); ++i) {
            for (const auto& re : patterns[i]) {
                if (starts_with(re, wide)) {
                    hits[i]++;
                    break;
                }
            }
        }
    }

    int best = category_index(BulletCategory::None);
    int best_hits = 0;
    for (size_t i = 0; i < hits.size(); ++i) {
        if (hits[i] > best_hits) {
            best = static_cast<int>(i);
            best_hits = hits[i];
        }
    }
    return static_cast<BulletCategory>(best);
}

OutlineMatcher::OutlineMatcher(std::vector<OutlineEntry> outline)
    : outline_(std::move(outline)) {}

HeadingLevels OutlineMatcher::classify(const std::vector<Block>& blocks) const {
    HeadingLevels result;

    int max_level = 0;
    for (const auto& entry : outline_) {
        max_level = std::max(max_level, entry.level);
    }
    result.pivot_level = std::max(0, max_level - 1);

    result.levels.reserve(blocks.size());
    for (const auto& block : blocks) {
        int level = max_level + 1;
        for (const auto& entry : outline_) {
            if (bigram_similarity(entry.text, block.text) > kOutlineSimilarityThreshold) {
                level = entry.level;
                break;
            }
        }
        result.levels.push_back(level);
    }

    return result;
}

HeadingLevels BulletFrequency::classify(const std::vector<Block>& blocks) const {
    static const std::regex title_label("(title|head)");

    BulletCategory category = BulletClassifier::detect_category(blocks);
    int size = BulletClassifier::pattern_count(category);
    int body_level = size + 1;

    HeadingLevels result;
    result.levels.assign(blocks.size(), body_level);
    result.pivot_level = body_level;

    if (blocks.empty() || category == BulletCategory::None) {
        return result;
    }

    for (size_t i = 0; i < blocks.size(); ++i) {
        const auto& block = blocks[i];
        int level = BulletClassifier::not_bullet(block.text)
                        ? -1
                        : BulletClassifier::match_level(category, block.text);
        if (level >= 0) {
            result.levels[i] = level;
        } else if (std::regex_search(block.layout_label, title_label) &&
                   !BulletClassifier::not_title(text::trim(block.text))) {
            result.levels[i] = size;
        }
    }

    // Most frequent heading level; ties go to the level seen first
    struct LevelCount {
        int level;
        int count;
    };
    std::vector<LevelCount> counts;
    for (int level : result.levels) {
        auto it = std::find_if(counts.begin(), counts.end(),
                               [level](const LevelCount& c) { return c.level == level; });
        if (it == counts.end()) {
            counts.push_back({level, 1});
        } else {
            it->count++;
        }
    }

    int best_count = 0;
    for (const auto& c : counts) {
        if (c.level <= size && c.count > best_count) {
            result.pivot_level = c.level;
            best_count = c.count;
        }
    }

    return result;
}

HeadingInference select_heading_inference(const std::vector<Block>& blocks,
                                          const std::optional<std::vector<OutlineEntry>>& outline) {
    if (outline && !outline->empty() && !blocks.empty() &&
        static_cast<double>(outline->size()) / static_cast<double>(blocks.size()) > kOutlineDensityThreshold) {
        return OutlineMatcher(*outline);
    }
    return BulletFrequency{};
}

HeadingLevels infer_heading_levels(const std::vector<Block>& blocks,
                                   const std::optional<std::vector<OutlineEntry>>& outline) {
    HeadingInference inference = select_heading_inference(blocks, outline);
    HeadingLevels result = std::visit(
        [&blocks](const auto& path) { return path.classify(blocks); }, inference);

    if (result.levels.size() != blocks.size()) {
        throw StructuralError("heading level count " + std::to_string(result.levels.size()) +
                              " does not match block count " + std::to_string(blocks.size()));
    }
    return result;
}

double bigram_similarity(const std::string& outline_text, const std::string& block_text) {
    std::wstring outline = text::to_wide(outline_text);
    std::wstring block = text::to_wide(block_text);

    auto outline_grams = bigrams(outline, outline.size());
    auto block_grams = bigrams(block, std::min(outline.size(), block.size()));

    size_t common = 0;
    for (const auto& gram : block_grams) {
        if (outline_grams.count(gram)) common++;
    }
    size_t combined = outline_grams.size() + block_grams.size() - common;
    if (combined == 0) {
        return 0.0;
    }
    return static_cast<double>(common) / static_cast<double>(combined);
}

} // namespace layout_chunker
