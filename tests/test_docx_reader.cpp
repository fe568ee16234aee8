#include <gtest/gtest.h>
#include <layout_chunker/docx_reader.h>
#include "docx_fixture.h"
#include <cstdio>

using namespace layout_chunker;
using namespace layout_chunker::test_support;

class DocxReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = write_sample_docx("layout_chunker_reader_test.docx");
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    std::string path_;
};

TEST_F(DocxReaderTest, ParagraphsInDocumentOrder) {
    DocxReader reader;
    auto doc = reader.read(path_);

    ASSERT_EQ(doc.paragraphs.size(), 5u);
    EXPECT_EQ(doc.paragraphs[0].text, "Installation");
    EXPECT_EQ(doc.paragraphs[1].text, "Run the installer.");
    EXPECT_EQ(doc.paragraphs[2].text, "Options");
    EXPECT_EQ(doc.paragraphs[3].text, "");
    EXPECT_EQ(doc.paragraphs[4].text, "a\tb\nc");
}

TEST_F(DocxReaderTest, ResolvesStyleNames) {
    DocxReader reader;
    auto doc = reader.read(path_);

    ASSERT_EQ(doc.paragraphs.size(), 5u);
    EXPECT_EQ(doc.paragraphs[0].style_name, "heading 1");
    EXPECT_EQ(doc.paragraphs[1].style_name, "Normal");
    EXPECT_EQ(doc.paragraphs[2].style_name, "heading 2");
}

TEST_F(DocxReaderTest, CountsPageBreaks) {
    DocxReader reader;
    auto doc = reader.read(path_);

    ASSERT_EQ(doc.paragraphs.size(), 5u);
    EXPECT_EQ(doc.paragraphs[0].page_breaks, 0);
    EXPECT_EQ(doc.paragraphs[1].page_breaks, 1);
    EXPECT_EQ(doc.paragraphs[2].page_breaks, 1);
    EXPECT_EQ(doc.paragraphs[4].page_breaks, 0);
}

TEST_F(DocxReaderTest, DecodesEmbeddedPicture) {
    DocxReader reader;
    auto doc = reader.read(path_);

    ASSERT_EQ(doc.paragraphs.size(), 5u);
    ASSERT_TRUE(doc.paragraphs[3].image.has_value());
    EXPECT_EQ(doc.paragraphs[3].image->pixels(), sample_picture().pixels());
    EXPECT_FALSE(doc.paragraphs[0].image.has_value());
}

TEST_F(DocxReaderTest, ExpandsMergedTableCells) {
    DocxReader reader;
    auto doc = reader.read(path_);

    ASSERT_EQ(doc.tables.size(), 1u);
    const auto& rows = doc.tables[0].rows;
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], (std::vector<std::string>{"Merged", "Merged", "C"}));
    EXPECT_EQ(rows[1], (std::vector<std::string>{"V", "x", "y"}));
    EXPECT_EQ(rows[2], (std::vector<std::string>{"V", "z", "w"}));
    EXPECT_TRUE(doc.tables[0].geometry.empty());
}

TEST_F(DocxReaderTest, ReadsFromMemory) {
    DocxReader reader;
    auto doc = reader.read(read_file(path_));

    EXPECT_EQ(doc.paragraphs.size(), 5u);
    EXPECT_EQ(doc.tables.size(), 1u);
}

TEST(DocxReaderErrorTest, RejectsNonZipInput) {
    DocxReader reader;
    std::string text = "plain text, not a package";
    EXPECT_THROW(reader.read(std::vector<uint8_t>(text.begin(), text.end())), std::runtime_error);
}

TEST(DocxReaderErrorTest, RejectsPackageWithoutDocumentPart) {
    std::string path = (std::filesystem::temp_directory_path() / "layout_chunker_no_body.docx").string();
    write_zip(path, {{"word/styles.xml", sample_styles_xml()}});

    DocxReader reader;
    EXPECT_THROW(reader.read(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST(DocxReaderErrorTest, MissingFileThrows) {
    DocxReader reader;
    EXPECT_THROW(reader.read(std::string("/nonexistent/missing.docx")), std::runtime_error);
}
