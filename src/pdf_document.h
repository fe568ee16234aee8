#pragma once

// Read access to one open PDF; shared by the layout engines, not installed.

#include "layout_chunker/layout_engine.h"
#include "mupdf_context.h"
#include <string>
#include <vector>

namespace layout_chunker {

struct TextLine {
    std::string text;
    float size = 0.0f;      // largest glyph size on the line
    bool bold = false;      // every visible glyph is bold
};

struct TextBlock {
    fz_rect bbox;
    std::vector<TextLine> lines;
};

class PdfDocument {
public:
    PdfDocument(MuPdfContext& mupdf, const DocumentSource& source);
    ~PdfDocument();

    PdfDocument(const PdfDocument&) = delete;
    PdfDocument& operator=(const PdfDocument&) = delete;

    int page_count() const { return page_count_; }

    std::vector<TextBlock> text_blocks(int page_number);

    // Depth-first outline, top level 0; empty when the file has none
    std::vector<OutlineEntry> outline();

    Image render(int page_number, float zoom);

private:
    MuPdfContext& mupdf_;
    fz_context* ctx_;
    fz_stream* stream_ = nullptr;
    fz_document* doc_ = nullptr;
    int page_count_ = 0;
};

} // namespace layout_chunker
