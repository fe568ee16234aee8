#include "layout_chunker/layout_engine.h"
#include "layout_chunker/text_utils.h"
#include "pdf_document.h"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iostream>

namespace layout_chunker {

namespace {

constexpr double kTitleSizeRatio = 1.2;
constexpr size_t kMaxTitleLines = 2;
constexpr float kRenderZoom = 3.0f;

void report(const ProgressCallback& progress, double value, const std::string& message) {
    if (progress) {
        progress(value, message);
    }
}

std::string elapsed_label(const std::string& what, std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), " (%.2fs)", elapsed);
    return what + buffer;
}

PageRange clamp(const PageRange& range, int page_count) {
    PageRange clamped;
    clamped.from = std::max(0, range.from);
    clamped.to = std::min(range.to, page_count);
    return clamped;
}

float median_line_size(const std::vector<TextBlock>& blocks) {
    std::vector<float> sizes;
    for (const auto& block : blocks) {
        for (const auto& line : block.lines) {
            if (line.size > 0.0f) sizes.push_back(line.size);
        }
    }
    if (sizes.empty()) return 0.0f;

    auto middle = sizes.begin() + sizes.size() / 2;
    std::nth_element(sizes.begin(), middle, sizes.end());
    return *middle;
}

bool looks_like_title(const TextBlock& block, float median_size) {
    if (block.lines.empty() || block.lines.size() > kMaxTitleLines) {
        return false;
    }

    bool all_bold = std::all_of(block.lines.begin(), block.lines.end(),
                                [](const TextLine& line) { return line.bold; });
    if (all_bold) {
        return true;
    }

    float largest = 0.0f;
    for (const auto& line : block.lines) {
        largest = std::max(largest, line.size);
    }
    return median_size > 0.0f && largest >= median_size * kTitleSizeRatio;
}

} // namespace

class MuPdfLayoutEngine::Impl {
public:
    LayoutResult extract(const DocumentSource& source, const PageRange& range,
                         const ProgressCallback& progress) {
        auto start = std::chrono::steady_clock::now();
        report(progress, -1.0, "OCR started");

        PdfDocument pdf(mupdf, source);
        PageRange pages = clamp(range, pdf.page_count());

        LayoutResult result;
        for (int page = pages.from; page < pages.to; ++page) {
            auto blocks = pdf.text_blocks(page);
            float median_size = median_line_size(blocks);

            for (const auto& text_block : blocks) {
                std::string text;
                for (const auto& line : text_block.lines) {
                    std::string collapsed = text::collapse_spaces(line.text);
                    if (collapsed.empty()) continue;
                    if (!text.empty()) text += "\n";
                    text += collapsed;
                }
                if (text.empty()) continue;

                Block block;
                block.text = std::move(text);
                block.layout_label = looks_like_title(text_block, median_size) ? "title" : "text";
                block.geometry.push_back({page - pages.from + 1,
                                          text_block.bbox.x0, text_block.bbox.x1,
                                          text_block.bbox.y0, text_block.bbox.y1});
                result.blocks.push_back(std::move(block));
            }
        }

        report(progress, -1.0, elapsed_label("OCR finished", start));

        start = std::chrono::steady_clock::now();
        result.outline = pdf.outline();
        report(progress, 0.65, elapsed_label("Layout analysis", start));

        // Structured text carries no table model; tables stay empty
        report(progress, 0.67, elapsed_label("Table analysis", start));
        report(progress, 0.68, elapsed_label("Text merged", start));

        return result;
    }

    MuPdfContext mupdf;
};

MuPdfLayoutEngine::MuPdfLayoutEngine() : pImpl(std::make_unique<Impl>()) {}
MuPdfLayoutEngine::~MuPdfLayoutEngine() = default;

LayoutResult MuPdfLayoutEngine::extract(const DocumentSource& source, const PageRange& range,
                                        const ProgressCallback& progress) {
    return pImpl->extract(source, range, progress);
}

class PlainTextLayoutEngine::Impl {
public:
    LayoutResult extract(const DocumentSource& source, const PageRange& range,
                         const ProgressCallback& progress) {
        report(progress, -1.0, "Plain text extraction started");

        PdfDocument pdf(mupdf, source);
        PageRange pages = clamp(range, pdf.page_count());

        LayoutResult result;
        for (int page = pages.from; page < pages.to; ++page) {
            for (const auto& text_block : pdf.text_blocks(page)) {
                for (const auto& line : text_block.lines) {
                    std::string text = text::collapse_spaces(line.text);
                    if (text.empty()) continue;

                    Block block;
                    block.text = std::move(text);
                    block.layout_label = "text";
                    block.geometry.push_back(Position{});
                    result.blocks.push_back(std::move(block));
                }
            }
        }

        result.outline = pdf.outline();
        report(progress, 0.68, "Text merged");
        return result;
    }

    MuPdfContext mupdf;
};

PlainTextLayoutEngine::PlainTextLayoutEngine() : pImpl(std::make_unique<Impl>()) {}
PlainTextLayoutEngine::~PlainTextLayoutEngine() = default;

LayoutResult PlainTextLayoutEngine::extract(const DocumentSource& source, const PageRange& range,
                                            const ProgressCallback& progress) {
    return pImpl->extract(source, range, progress);
}

VisionLayoutEngine::VisionLayoutEngine(std::shared_ptr<VisionModel> model, std::string name)
    : model_(std::move(model)), name_(std::move(name)) {}

VisionLayoutEngine::~VisionLayoutEngine() = default;

LayoutResult VisionLayoutEngine::extract(const DocumentSource& source, const PageRange& range,
                                         const ProgressCallback& progress) {
    if (!model_) {
        throw std::runtime_error("No vision model configured for layout recognizer '" + name_ + "'");
    }

    MuPdfContext mupdf;
    PdfDocument pdf(mupdf, source);
    PageRange pages = clamp(range, pdf.page_count());
    int total = std::max(1, pages.to - pages.from);

    LayoutResult result;
    for (int page = pages.from; page < pages.to; ++page) {
        Image image = pdf.render(page, kRenderZoom);
        std::string text = text::trim(model_->describe(image, page_transcription_prompt(page + 1)));

        report(progress, 0.7 * (page - pages.from + 1) / total,
               "Processed page " + std::to_string(page + 1) + " with " + name_);

        if (text.empty()) continue;

        Block block;
        block.text = std::move(text);
        block.layout_label = "text";
        // Transcripts have no coordinates on the page
        block.geometry.push_back(Position{});
        result.blocks.push_back(std::move(block));
    }

    return result;
}

} // namespace layout_chunker
