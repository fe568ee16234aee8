#include "layout_chunker/docx_reader.h"
#include "mupdf_context.h"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <iostream>
#include <map>
#include <optional>

namespace layout_chunker {

namespace {

// Tag name without namespace prefix; nullptr for text nodes
const char* local_name(fz_xml* node) {
    const char* tag = fz_xml_tag(node);
    if (!tag) return nullptr;
    const char* colon = std::strrchr(tag, ':');
    return colon ? colon + 1 : tag;
}

bool is_element(fz_xml* node, const char* name) {
    const char* local = local_name(node);
    return local && std::strcmp(local, name) == 0;
}

// Looks up "w:val" and falls back to "val" for parsers that drop prefixes
const char* attribute(fz_xml* node, const char* prefixed) {
    const char* value = fz_xml_att(node, prefixed);
    if (value) return value;
    const char* colon = std::strchr(prefixed, ':');
    return colon ? fz_xml_att(node, colon + 1) : nullptr;
}

fz_xml* child(fz_xml* node, const char* name) {
    if (!node) return nullptr;
    for (fz_xml* c = fz_xml_down(node); c; c = fz_xml_next(c)) {
        if (is_element(c, name)) return c;
    }
    return nullptr;
}

bool is_opaque(fz_xml* node) {
    return is_element(node, "drawing") || is_element(node, "pict") ||
           is_element(node, "AlternateContent") || is_element(node, "pPr") ||
           is_element(node, "rPr");
}

// Depth-first over descendants, skipping embedded drawings and property blocks
void walk(fz_xml* node, const std::function<void(fz_xml*)>& visit) {
    for (fz_xml* c = fz_xml_down(node); c; c = fz_xml_next(c)) {
        if (!fz_xml_tag(c) || is_opaque(c)) continue;
        visit(c);
        walk(c, visit);
    }
}

fz_xml* find_descendant(fz_xml* node, const char* name) {
    for (fz_xml* c = fz_xml_down(node); c; c = fz_xml_next(c)) {
        if (is_element(c, name)) return c;
        if (fz_xml* found = find_descendant(c, name)) return found;
    }
    return nullptr;
}

std::string element_text(fz_xml* node) {
    std::string text;
    for (fz_xml* c = fz_xml_down(node); c; c = fz_xml_next(c)) {
        if (const char* t = fz_xml_text(c)) text += t;
    }
    return text;
}

std::string paragraph_text(fz_xml* p) {
    std::string text;
    walk(p, [&text](fz_xml* node) {
        if (is_element(node, "t")) {
            text += element_text(node);
        } else if (is_element(node, "tab")) {
            text += "\t";
        } else if (is_element(node, "br") || is_element(node, "cr")) {
            const char* type = attribute(node, "w:type");
            if (!type || std::strcmp(type, "page") != 0) {
                text += "\n";
            }
        }
    });
    return text;
}

// One per run holding a rendered page break, else one per run with a
// page-type line break
int count_page_breaks(fz_xml* p) {
    int breaks = 0;
    walk(p, [&breaks](fz_xml* node) {
        if (!is_element(node, "r")) return;
        if (find_descendant(node, "lastRenderedPageBreak")) {
            breaks++;
            return;
        }
        for (fz_xml* c = fz_xml_down(node); c; c = fz_xml_next(c)) {
            if (is_element(c, "br")) {
                const char* type = attribute(c, "w:type");
                if (type && std::strcmp(type, "page") == 0) {
                    breaks++;
                    return;
                }
            }
        }
    });
    return breaks;
}

} // namespace

// Parsed XML part; owns the MuPDF tree
class XmlPart {
public:
    XmlPart(MuPdfContext& mupdf, const std::string& content, const std::string& name)
        : ctx_(mupdf.get()) {
        fz_buffer* buf = nullptr;
        fz_var(buf);

        fz_try(ctx_) {
            buf = fz_new_buffer_from_copied_data(
                ctx_, reinterpret_cast<const unsigned char*>(content.data()), content.size());
            doc_ = fz_parse_xml(ctx_, buf, 1);
        }
        fz_always(ctx_) {
            fz_drop_buffer(ctx_, buf);
        }
        fz_catch(ctx_) {
            mupdf.rethrow("Malformed XML in " + name);
        }
    }

    ~XmlPart() {
        if (doc_) fz_drop_xml(ctx_, doc_);
    }

    XmlPart(const XmlPart&) = delete;
    XmlPart& operator=(const XmlPart&) = delete;

    // First element at top level
    fz_xml* root() const {
        fz_xml* node = doc_ ? fz_xml_root(doc_) : nullptr;
        while (node && !fz_xml_tag(node)) {
            node = fz_xml_next(node);
        }
        return node;
    }

private:
    fz_context* ctx_;
    decltype(fz_parse_xml(nullptr, nullptr, 0)) doc_ = nullptr;
};

class DocxReader::Impl {
public:
    DocxDocument read_path(const std::string& path) {
        fz_context* ctx = mupdf_.get();
        fz_archive* archive = nullptr;
        fz_var(archive);

        fz_try(ctx) {
            archive = fz_open_zip_archive(ctx, path.c_str());
        }
        fz_catch(ctx) {
            mupdf_.rethrow("Failed to open DOCX " + path);
        }

        ArchiveHandle handle{ctx, archive};
        return read_archive(archive);
    }

    DocxDocument read_bytes(const std::vector<uint8_t>& bytes) {
        fz_context* ctx = mupdf_.get();
        fz_buffer* buf = nullptr;
        fz_stream* stream = nullptr;
        fz_archive* archive = nullptr;

        fz_var(buf);
        fz_var(stream);
        fz_var(archive);

        fz_try(ctx) {
            buf = fz_new_buffer_from_copied_data(ctx, bytes.data(), bytes.size());
            stream = fz_open_buffer(ctx, buf);
            archive = fz_open_zip_archive_with_stream(ctx, stream);
        }
        fz_always(ctx) {
            fz_drop_stream(ctx, stream);
            fz_drop_buffer(ctx, buf);
        }
        fz_catch(ctx) {
            mupdf_.rethrow("Failed to open DOCX from memory");
        }

        ArchiveHandle handle{ctx, archive};
        return read_archive(archive);
    }

private:
    struct ArchiveHandle {
        fz_context* ctx;
        fz_archive* archive;
        ~ArchiveHandle() { fz_drop_archive(ctx, archive); }
    };

    DocxDocument read_archive(fz_archive* archive) {
        auto document_xml = read_entry(archive, "word/document.xml");
        if (!document_xml) {
            throw std::runtime_error("Not a WordprocessingML package: word/document.xml missing");
        }

        styles_.clear();
        relationships_.clear();
        if (auto styles_xml = read_entry(archive, "word/styles.xml")) {
            load_styles(*styles_xml);
        }
        if (auto rels_xml = read_entry(archive, "word/_rels/document.xml.rels")) {
            load_relationships(*rels_xml);
        }

        XmlPart part(mupdf_, *document_xml, "word/document.xml");
        fz_xml* body = child(part.root(), "body");
        if (!body) {
            throw std::runtime_error("word/document.xml has no body");
        }

        DocxDocument doc;
        for (fz_xml* node = fz_xml_down(body); node; node = fz_xml_next(node)) {
            if (is_element(node, "p")) {
                doc.paragraphs.push_back(read_paragraph(archive, node));
            } else if (is_element(node, "tbl")) {
                doc.tables.push_back(read_table(node));
            }
        }
        return doc;
    }

    std::optional<std::string> read_entry(fz_archive* archive, const std::string& name) {
        fz_context* ctx = mupdf_.get();
        fz_buffer* buf = nullptr;
        fz_var(buf);

        std::optional<std::string> data;

        fz_try(ctx) {
            if (fz_has_archive_entry(ctx, archive, name.c_str())) {
                buf = fz_read_archive_entry(ctx, archive, name.c_str());
                unsigned char* bytes = nullptr;
                size_t len = fz_buffer_storage(ctx, buf, &bytes);
                data = std::string(reinterpret_cast<const char*>(bytes), len);
            }
        }
        fz_always(ctx) {
            fz_drop_buffer(ctx, buf);
        }
        fz_catch(ctx) {
            mupdf_.rethrow("Failed to read " + name);
        }

        return data;
    }

    void load_styles(const std::string& content) {
        XmlPart part(mupdf_, content, "word/styles.xml");
        fz_xml* root = part.root();
        if (!root) return;

        for (fz_xml* style = fz_xml_down(root); style; style = fz_xml_next(style)) {
            if (!is_element(style, "style")) continue;
            const char* id = attribute(style, "w:styleId");
            fz_xml* name = child(style, "name");
            const char* value = name ? attribute(name, "w:val") : nullptr;
            if (id && value) {
                styles_[id] = value;
            }
        }
    }

    void load_relationships(const std::string& content) {
        XmlPart part(mupdf_, content, "word/_rels/document.xml.rels");
        fz_xml* root = part.root();
        if (!root) return;

        for (fz_xml* rel = fz_xml_down(root); rel; rel = fz_xml_next(rel)) {
            if (!is_element(rel, "Relationship")) continue;
            const char* id = fz_xml_att(rel, "Id");
            const char* target = fz_xml_att(rel, "Target");
            if (id && target) {
                relationships_[id] = target;
            }
        }
    }

    std::string style_name(fz_xml* p) const {
        fz_xml* style = child(child(p, "pPr"), "pStyle");
        const char* id = style ? attribute(style, "w:val") : nullptr;
        if (!id) return "Normal";

        auto it = styles_.find(id);
        return it != styles_.end() ? it->second : std::string(id);
    }

    Paragraph read_paragraph(fz_archive* archive, fz_xml* p) {
        Paragraph paragraph;
        paragraph.text = paragraph_text(p);
        paragraph.style_name = style_name(p);
        paragraph.page_breaks = count_page_breaks(p);
        paragraph.image = read_image(archive, p);
        return paragraph;
    }

    // First picture of the paragraph, decoded
    std::optional<Image> read_image(fz_archive* archive, fz_xml* p) {
        fz_xml* blip = find_descendant(p, "blip");
        if (!blip) return std::nullopt;

        const char* embed = attribute(blip, "r:embed");
        if (!embed) return std::nullopt;

        auto rel = relationships_.find(embed);
        if (rel == relationships_.end()) return std::nullopt;

        const std::string& target = rel->second;
        if (target.empty()) return std::nullopt;
        std::string entry = target.front() == '/' ? target.substr(1) : "word/" + target;

        auto bytes = read_entry(archive, entry);
        if (!bytes) {
            std::cerr << "[DocxReader::read_image] Warning: missing image part " << entry << std::endl;
            return std::nullopt;
        }

        try {
            return Image::decode(std::vector<uint8_t>(bytes->begin(), bytes->end()));
        } catch (const std::runtime_error& e) {
            std::cerr << "[DocxReader::read_image] Warning: skipping " << entry << ": "
                      << e.what() << std::endl;
            return std::nullopt;
        }
    }

    TableGrid read_table(fz_xml* tbl) const {
        TableGrid grid;

        for (fz_xml* tr = fz_xml_down(tbl); tr; tr = fz_xml_next(tr)) {
            if (!is_element(tr, "tr")) continue;

            std::vector<std::string> row;
            for (fz_xml* tc = fz_xml_down(tr); tc; tc = fz_xml_next(tc)) {
                if (!is_element(tc, "tc")) continue;

                std::string text;
                bool first = true;
                for (fz_xml* p = fz_xml_down(tc); p; p = fz_xml_next(p)) {
                    if (!is_element(p, "p")) continue;
                    if (!first) text += "\n";
                    text += paragraph_text(p);
                    first = false;
                }

                fz_xml* props = child(tc, "tcPr");
                int span = 1;
                if (fz_xml* grid_span = child(props, "gridSpan")) {
                    const char* value = attribute(grid_span, "w:val");
                    if (value) span = std::max(1, std::atoi(value));
                }

                // vMerge without val, or val="continue", extends the cell above
                if (fz_xml* vmerge = child(props, "vMerge")) {
                    const char* value = attribute(vmerge, "w:val");
                    size_t column = row.size();
                    if ((!value || std::strcmp(value, "continue") == 0) &&
                        !grid.rows.empty() && column < grid.rows.back().size()) {
                        text = grid.rows.back()[column];
                    }
                }

                for (int k = 0; k < span; ++k) {
                    row.push_back(text);
                }
            }
            grid.rows.push_back(std::move(row));
        }

        return grid;
    }

    MuPdfContext mupdf_;
    std::map<std::string, std::string> styles_;
    std::map<std::string, std::string> relationships_;
};

DocxReader::DocxReader() : pImpl(std::make_unique<Impl>()) {}
DocxReader::~DocxReader() = default;

DocxDocument DocxReader::read(const std::string& path) {
    return pImpl->read_path(path);
}

DocxDocument DocxReader::read(const std::vector<uint8_t>& bytes) {
    return pImpl->read_bytes(bytes);
}

} // namespace layout_chunker
