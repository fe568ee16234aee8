#pragma once

#include "layout_chunker/qa_reconstructor.h"
#include "layout_chunker/types.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace layout_chunker {

// Body paragraphs and tables of a .docx, in document order
struct DocxDocument {
    std::vector<Paragraph> paragraphs;
    std::vector<TableGrid> tables;
};

// Reads WordprocessingML packages through MuPDF's zip and XML support.
// Style ids are resolved to style names via styles.xml; horizontally merged
// cells (gridSpan) and vertical continuations (vMerge) repeat the text of the
// cell they extend, so merged regions show up as runs of equal cells.
class DocxReader {
public:
    DocxReader();
    ~DocxReader();

    DocxDocument read(const std::string& path);
    DocxDocument read(const std::vector<uint8_t>& bytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace layout_chunker
