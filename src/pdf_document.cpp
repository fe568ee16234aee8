#include "pdf_document.h"
#include <algorithm>
#include <functional>
#include <memory>

namespace layout_chunker {

namespace {

void collect_outline(fz_outline* node, int depth, std::vector<OutlineEntry>& entries) {
    for (; node; node = node->next) {
        if (node->title) {
            entries.push_back({node->title, depth});
        }
        collect_outline(node->down, depth + 1, entries);
    }
}

} // namespace

PdfDocument::PdfDocument(MuPdfContext& mupdf, const DocumentSource& source)
    : mupdf_(mupdf), ctx_(mupdf.get()) {
    fz_try(ctx_) {
        if (source.in_memory()) {
            stream_ = fz_open_memory(ctx_, source.bytes.data(), source.bytes.size());
            doc_ = fz_open_document_with_stream(ctx_, "pdf", stream_);
        } else {
            doc_ = fz_open_document(ctx_, source.path.c_str());
        }
        page_count_ = fz_count_pages(ctx_, doc_);
    }
    fz_catch(ctx_) {
        fz_drop_document(ctx_, doc_);
        fz_drop_stream(ctx_, stream_);
        mupdf_.rethrow("Failed to open PDF " + (source.path.empty() ? source.name : source.path));
    }
}

PdfDocument::~PdfDocument() {
    fz_drop_document(ctx_, doc_);
    fz_drop_stream(ctx_, stream_);
}

std::vector<TextBlock> PdfDocument::text_blocks(int page_number) {
    fz_page* page = nullptr;
    fz_stext_page* stext = nullptr;

    fz_var(page);
    fz_var(stext);

    std::vector<TextBlock> blocks;

    fz_try(ctx_) {
        page = fz_load_page(ctx_, doc_, page_number);

        fz_stext_options opts = { 0 };
        opts.flags = FZ_STEXT_PRESERVE_LIGATURES | FZ_STEXT_PRESERVE_WHITESPACE;
        stext = fz_new_stext_page_from_page(ctx_, page, &opts);

        for (fz_stext_block* block = stext->first_block; block; block = block->next) {
            if (block->type != FZ_STEXT_BLOCK_TEXT) continue;

            TextBlock text_block;
            text_block.bbox = block->bbox;

            for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
                TextLine text_line;
                bool any_visible = false;
                bool all_bold = true;

                for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                    char utf8[FZ_UTFMAX];
                    int len = fz_runetochar(utf8, ch->c);
                    text_line.text.append(utf8, len);
                    text_line.size = std::max(text_line.size, ch->size);

                    if (ch->c != ' ' && ch->c != '\t') {
                        any_visible = true;
                        if (!ch->font || !fz_font_is_bold(ctx_, ch->font)) {
                            all_bold = false;
                        }
                    }
                }

                text_line.bold = any_visible && all_bold;
                text_block.lines.push_back(std::move(text_line));
            }

            blocks.push_back(std::move(text_block));
        }
    }
    fz_always(ctx_) {
        fz_drop_stext_page(ctx_, stext);
        fz_drop_page(ctx_, page);
    }
    fz_catch(ctx_) {
        mupdf_.rethrow("Failed to extract page " + std::to_string(page_number + 1));
    }

    return blocks;
}

std::vector<OutlineEntry> PdfDocument::outline() {
    fz_outline* root = nullptr;
    fz_var(root);

    std::vector<OutlineEntry> entries;

    fz_try(ctx_) {
        root = fz_load_outline(ctx_, doc_);
        collect_outline(root, 0, entries);
    }
    fz_always(ctx_) {
        fz_drop_outline(ctx_, root);
    }
    fz_catch(ctx_) {
        mupdf_.rethrow("Failed to load outline");
    }

    return entries;
}

Image PdfDocument::render(int page_number, float zoom) {
    fz_pixmap* pix = nullptr;
    fz_var(pix);

    fz_try(ctx_) {
        pix = fz_new_pixmap_from_page_number(ctx_, doc_, page_number, fz_scale(zoom, zoom),
                                             fz_device_rgb(ctx_), 0);
    }
    fz_catch(ctx_) {
        mupdf_.rethrow("Failed to render page " + std::to_string(page_number + 1));
    }

    fz_context* ctx = ctx_;
    std::unique_ptr<fz_pixmap, std::function<void(fz_pixmap*)>> owned(
        pix, [ctx](fz_pixmap* p) { fz_drop_pixmap(ctx, p); });
    return image_from_pixmap(ctx_, owned.get());
}

} // namespace layout_chunker
