#pragma once

#include "layout_chunker/image.h"
#include "layout_chunker/vision_model.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace layout_chunker {

// One paragraph of a hierarchical (DOCX) source
struct Paragraph {
    std::string text;
    std::string style_name;
    std::optional<Image> image;
    int page_breaks = 0;    // page-break markers found in its runs
};

// Heading path from root to leaf plus the content found under it
struct QaUnit {
    std::vector<std::string> heading_path;
    std::string answer;
    std::optional<Image> image;

    std::string question() const;   // heading path joined with '\n'
    std::string text() const;       // question + '\n' + answer
};

constexpr int kMaxHeadingLevel = 6;

class QaReconstructor {
public:
    // vision may be null: embedded images are then concatenated, not described
    explicit QaReconstructor(VisionModel* vision = nullptr,
                             std::string image_prompt = kImageExtractionPrompt);

    // Pages are counted from 0. Paragraphs outside [from_page, to_page)
    // contribute no text, but their pictures still join the current answer.
    std::vector<QaUnit> reconstruct(const std::vector<Paragraph>& paragraphs,
                                    int from_page = 0, int to_page = 100000) const;

    // "Heading N" style (case-insensitive, space optional) -> N, anything else -> 0
    static int heading_level(const std::string& style_name);

private:
    // Per-document state of one reconstruction
    struct Context {
        int page = 0;
        std::string answer;
        std::optional<Image> pending_image;
        std::vector<std::pair<std::string, int>> stack;     // (heading, level)
        std::vector<QaUnit> units;
    };

    void append_body(Context& ctx, const std::string& text, const std::optional<Image>& image) const;
    void open_heading(Context& ctx, const std::string& text, int level) const;
    void flush(Context& ctx) const;

    VisionModel* vision_;
    std::string image_prompt_;
};

} // namespace layout_chunker
