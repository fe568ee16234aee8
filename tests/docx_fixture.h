#pragma once

// Writes small WordprocessingML packages for the DOCX tests

#include "mupdf_context.h"
#include <layout_chunker/image.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <vector>

namespace layout_chunker {
namespace test_support {

inline void write_zip(const std::string& path, const std::map<std::string, std::string>& entries) {
    MuPdfContext mupdf;
    fz_context* ctx = mupdf.get();

    fz_zip_writer* zip = nullptr;
    fz_buffer* buf = nullptr;
    fz_var(zip);
    fz_var(buf);

    fz_try(ctx) {
        zip = fz_new_zip_writer(ctx, path.c_str());
        for (const auto& entry : entries) {
            buf = fz_new_buffer_from_copied_data(
                ctx, reinterpret_cast<const unsigned char*>(entry.second.data()), entry.second.size());
            fz_write_zip_entry(ctx, zip, entry.first.c_str(), buf, 1);
            fz_drop_buffer(ctx, buf);
            buf = nullptr;
        }
        fz_close_zip_writer(ctx, zip);
    }
    fz_always(ctx) {
        fz_drop_buffer(ctx, buf);
        fz_drop_zip_writer(ctx, zip);
    }
    fz_catch(ctx) {
        mupdf.rethrow("Failed to write " + path);
    }
}

inline std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

inline const char* kDocxNamespaces =
    "xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\" "
    "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\" "
    "xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" "
    "xmlns:wp=\"http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing\" "
    "xmlns:pic=\"http://schemas.openxmlformats.org/drawingml/2006/picture\"";

// Heading "Installation", a two-run paragraph ending its page, heading
// "Options" on the next page, a picture, a tab/break paragraph and a table
// with a horizontal and a vertical merge.
inline std::string sample_document_xml() {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>";
    xml += "<w:document ";
    xml += kDocxNamespaces;
    xml += "><w:body>";

    xml += "<w:p><w:pPr><w:pStyle w:val=\"Heading1\"/></w:pPr>"
           "<w:r><w:t>Installation</w:t></w:r></w:p>";

    xml += "<w:p><w:r><w:rPr><w:b/></w:rPr><w:t xml:space=\"preserve\">Run the </w:t></w:r>"
           "<w:r><w:t>installer.</w:t><w:br w:type=\"page\"/></w:r></w:p>";

    xml += "<w:p><w:pPr><w:pStyle w:val=\"Heading2\"/></w:pPr>"
           "<w:r><w:lastRenderedPageBreak/><w:t>Options</w:t></w:r></w:p>";

    xml += "<w:p><w:r><w:drawing><wp:inline><a:graphic><a:graphicData><pic:pic><pic:blipFill>"
           "<a:blip r:embed=\"rId5\"/>"
           "</pic:blipFill></pic:pic></a:graphicData></a:graphic></wp:inline></w:drawing></w:r></w:p>";

    xml += "<w:p><w:r><w:t>a</w:t><w:tab/><w:t>b</w:t><w:br/><w:t>c</w:t></w:r></w:p>";

    xml += "<w:tbl><w:tblPr/>"
           "<w:tr>"
           "<w:tc><w:tcPr><w:gridSpan w:val=\"2\"/></w:tcPr><w:p><w:r><w:t>Merged</w:t></w:r></w:p></w:tc>"
           "<w:tc><w:p><w:r><w:t>C</w:t></w:r></w:p></w:tc>"
           "</w:tr>"
           "<w:tr>"
           "<w:tc><w:tcPr><w:vMerge w:val=\"restart\"/></w:tcPr><w:p><w:r><w:t>V</w:t></w:r></w:p></w:tc>"
           "<w:tc><w:p><w:r><w:t>x</w:t></w:r></w:p></w:tc>"
           "<w:tc><w:p><w:r><w:t>y</w:t></w:r></w:p></w:tc>"
           "</w:tr>"
           "<w:tr>"
           "<w:tc><w:tcPr><w:vMerge/></w:tcPr><w:p/></w:tc>"
           "<w:tc><w:p><w:r><w:t>z</w:t></w:r></w:p></w:tc>"
           "<w:tc><w:p><w:r><w:t>w</w:t></w:r></w:p></w:tc>"
           "</w:tr>"
           "</w:tbl>";

    xml += "<w:sectPr/></w:body></w:document>";
    return xml;
}

inline std::string sample_styles_xml() {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>";
    xml += "<w:styles ";
    xml += kDocxNamespaces;
    xml += ">"
           "<w:style w:type=\"paragraph\" w:styleId=\"Normal\"><w:name w:val=\"Normal\"/></w:style>"
           "<w:style w:type=\"paragraph\" w:styleId=\"Heading1\"><w:name w:val=\"heading 1\"/></w:style>"
           "<w:style w:type=\"paragraph\" w:styleId=\"Heading2\"><w:name w:val=\"heading 2\"/></w:style>"
           "</w:styles>";
    return xml;
}

inline std::string sample_relationships_xml() {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
           "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
           "<Relationship Id=\"rId1\" "
           "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" "
           "Target=\"styles.xml\"/>"
           "<Relationship Id=\"rId5\" "
           "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/image\" "
           "Target=\"media/image1.png\"/>"
           "</Relationships>";
}

// 2x2 picture, red on top and blue below
inline Image sample_picture() {
    return Image(2, 2, {255, 0, 0, 255, 0, 0, 0, 0, 255, 0, 0, 255});
}

// Writes the sample package into the temp directory and returns its path
inline std::string write_sample_docx(const std::string& filename) {
    std::vector<uint8_t> png = sample_picture().to_png();

    std::map<std::string, std::string> entries = {
        {"[Content_Types].xml",
         "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
         "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\"/>"},
        {"word/document.xml", sample_document_xml()},
        {"word/styles.xml", sample_styles_xml()},
        {"word/_rels/document.xml.rels", sample_relationships_xml()},
        {"word/media/image1.png", std::string(png.begin(), png.end())},
    };

    std::string path = (std::filesystem::temp_directory_path() / filename).string();
    write_zip(path, entries);
    return path;
}

} // namespace test_support
} // namespace layout_chunker
