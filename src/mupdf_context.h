#pragma once

// MuPDF plumbing shared by the extraction sources; not installed.

#include "layout_chunker/image.h"
#include <mupdf/fitz.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace layout_chunker {

// Owns one fz_context. MuPDF contexts are not shared between threads, so
// every extractor/reader instance creates its own.
class MuPdfContext {
public:
    MuPdfContext() {
        ctx_ = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
        if (!ctx_) {
            throw std::runtime_error("Failed to create MuPDF context");
        }
        fz_register_document_handlers(ctx_);
    }

    ~MuPdfContext() {
        if (ctx_) {
            fz_drop_context(ctx_);
        }
    }

    MuPdfContext(const MuPdfContext&) = delete;
    MuPdfContext& operator=(const MuPdfContext&) = delete;

    fz_context* get() const { return ctx_; }

    // Call from fz_catch only
    void rethrow(const std::string& what) const {
        const char* message = fz_caught_message(ctx_);
        throw std::runtime_error(what + ": " + (message ? message : "unknown MuPDF error"));
    }

private:
    fz_context* ctx_ = nullptr;
};

// Copies an RGB pixmap without alpha into an Image
inline Image image_from_pixmap(fz_context* ctx, fz_pixmap* pix) {
    int width = fz_pixmap_width(ctx, pix);
    int height = fz_pixmap_height(ctx, pix);
    int stride = static_cast<int>(fz_pixmap_stride(ctx, pix));
    const unsigned char* samples = fz_pixmap_samples(ctx, pix);

    std::vector<uint8_t> rgb(static_cast<size_t>(width) * height * 3);
    for (int y = 0; y < height; ++y) {
        const unsigned char* row = samples + static_cast<size_t>(y) * stride;
        std::copy(row, row + width * 3, rgb.begin() + static_cast<size_t>(y) * width * 3);
    }
    return Image(width, height, std::move(rgb));
}

} // namespace layout_chunker
