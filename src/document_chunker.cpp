#include "layout_chunker/document_chunker.h"
#include "layout_chunker/docx_reader.h"
#include "layout_chunker/heading_classifier.h"
#include "layout_chunker/qa_reconstructor.h"
#include "layout_chunker/section_assigner.h"
#include "layout_chunker/table_normalizer.h"
#include "layout_chunker/text_utils.h"
#include "layout_chunker/thread_pool.h"
#include "layout_chunker/tiktoken_tokenizer.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <mutex>

namespace layout_chunker {

namespace {

const std::string kDeepDoc = "DeepDOC";
const std::string kPlainText = "Plain Text";

bool is_builtin_recognizer(const std::string& name) {
    return name == kDeepDoc || name == kPlainText;
}

std::string display_name(const DocumentInput& input) {
    if (!input.name.empty()) return input.name;
    return std::filesystem::path(input.path).filename().string();
}

void report(const ProgressCallback& progress, double value, const std::string& message) {
    if (progress) {
        progress(value, message);
    }
}

Geometry non_zero(const Geometry& geometry) {
    Geometry kept;
    for (const auto& pos : geometry) {
        if (!pos.is_zero()) kept.push_back(pos);
    }
    return kept;
}

// Fields every record of one document shares
struct DocumentMeta {
    std::string doc_name;
    std::string title;
    bool english = false;
};

} // namespace

const char* to_string(RecordKind kind) {
    switch (kind) {
        case RecordKind::Text: return "text";
        case RecordKind::Table: return "table";
        case RecordKind::Image: return "image";
    }
    return "text";
}

class DocumentChunker::Impl {
public:
    explicit Impl(const ChunkerOptions& options)
        : options_(options),
          thread_pool_(options.thread_count) {
        if (options_.vocabulary_path.empty()) {
            tokenizer_ = std::make_shared<EstimatingTokenizer>();
        } else {
            tokenizer_ = std::make_shared<TiktokenTokenizer>(options_.vocabulary_path);
        }

        stats_["documents_processed"] = 0;
        stats_["documents_failed"] = 0;
        stats_["records_produced"] = 0;
        stats_["total_processing_time_ms"] = 0.0;
    }

    std::vector<IndexRecord> chunk(const DocumentInput& input, const ProgressCallback& progress) {
        auto start_time = std::chrono::high_resolution_clock::now();

        DocumentMeta meta;
        meta.doc_name = display_name(input);
        meta.title = text::strip_extension(meta.doc_name);
        meta.english = text::to_lower(input.lang) == "english";

        std::string extension = text::file_extension(meta.doc_name);
        if (extension != "pdf" && extension != "docx") {
            throw UnsupportedFormatError("file type not supported yet (pdf and docx supported): " +
                                         meta.doc_name);
        }

        if (options_.verbose) {
            std::cout << "[DocumentChunker::chunk] Processing " << meta.doc_name
                      << " pages [" << input.from_page << ", " << input.to_page << ")"
                      << " with " << input.config.layout_recognize << std::endl;
        }

        std::vector<IndexRecord> records = extension == "pdf"
            ? chunk_pdf(input, meta, progress)
            : chunk_docx(input, meta, progress);

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration<double, std::milli>(end_time - start_time).count();

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_["documents_processed"] = stats_["documents_processed"].get<int>() + 1;
            stats_["records_produced"] = stats_["records_produced"].get<size_t>() + records.size();
            stats_["total_processing_time_ms"] = stats_["total_processing_time_ms"].get<double>() + duration;
        }

        if (options_.verbose) {
            std::cout << "[DocumentChunker::chunk] " << meta.doc_name << ": " << records.size()
                      << " records in " << duration << "ms" << std::endl;
        }

        return records;
    }

    std::vector<ChunkingResult> chunk_batch(const std::vector<DocumentInput>& inputs,
                                            const BatchProgressCallback& progress) {
        std::vector<ChunkingResult> results(inputs.size());
        std::atomic<size_t> completed{0};
        std::mutex progress_mutex;

        std::vector<std::future<void>> futures;
        futures.reserve(inputs.size());

        for (size_t i = 0; i < inputs.size(); ++i) {
            futures.push_back(
                thread_pool_.enqueue([this, i, &inputs, &results, &completed, &progress, &progress_mutex]() {
                    auto start_time = std::chrono::high_resolution_clock::now();
                    ChunkingResult& result = results[i];
                    result.doc_name = display_name(inputs[i]);

                    try {
                        result.records = chunk(inputs[i], nullptr);
                        result.success = true;
                    } catch (const std::exception& e) {
                        std::cerr << "[DocumentChunker::chunk_batch] Error processing "
                                  << result.doc_name << ": " << e.what() << std::endl;
                        result.error = e.what();
                        result.success = false;

                        std::lock_guard<std::mutex> lock(stats_mutex_);
                        stats_["documents_failed"] = stats_["documents_failed"].get<int>() + 1;
                    }

                    auto end_time = std::chrono::high_resolution_clock::now();
                    result.processing_time_ms =
                        std::chrono::duration<double, std::milli>(end_time - start_time).count();

                    size_t done = ++completed;
                    if (progress) {
                        std::lock_guard<std::mutex> lock(progress_mutex);
                        progress(done, inputs.size());
                    }
                })
            );
        }

        for (auto& future : futures) {
            future.get();
        }

        return results;
    }

    nlohmann::json get_stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        nlohmann::json stats = stats_;

        if (stats["documents_processed"].get<int>() > 0) {
            stats["average_processing_time_ms"] = stats["total_processing_time_ms"].get<double>() /
                                                  stats["documents_processed"].get<double>();
        }

        return stats;
    }

    std::shared_ptr<Tokenizer> tokenizer_;
    std::shared_ptr<VisionModel> vision_model_;
    LayoutEngineFactory engine_factory_;

private:
    std::unique_ptr<LayoutEngine> make_engine(const std::string& layout_recognize) const {
        auto engine = engine_factory_
            ? engine_factory_(layout_recognize)
            : DocumentChunker::make_layout_engine(layout_recognize, vision_model_);
        if (!engine) {
            throw std::runtime_error("No layout engine for '" + layout_recognize + "'");
        }
        return engine;
    }

    LayoutResult extract_layout(const DocumentInput& input, const DocumentMeta& meta,
                                const ProgressCallback& progress) const {
        DocumentSource source{meta.doc_name, input.path, input.bytes};
        PageRange range{input.from_page, input.to_page};
        const std::string& recognizer = input.config.layout_recognize;

        if (is_builtin_recognizer(recognizer)) {
            return make_engine(recognizer)->extract(source, range, progress);
        }

        try {
            LayoutResult layout = make_engine(recognizer)->extract(source, range, progress);
            report(progress, 0.8, "Vision model parsing completed.");
            return layout;
        } catch (const std::exception& e) {
            std::cerr << "[DocumentChunker::chunk] Warning: failed to use vision model "
                      << recognizer << ": " << e.what() << ". Falling back to " << kDeepDoc
                      << "." << std::endl;
        }

        return make_engine(kDeepDoc)->extract(source, range, progress);
    }

    std::vector<IndexRecord> chunk_pdf(const DocumentInput& input, const DocumentMeta& meta,
                                       const ProgressCallback& progress) const {
        LayoutResult layout = extract_layout(input, meta, progress);

        if (options_.verbose) {
            std::cout << "[DocumentChunker::chunk_pdf] " << layout.blocks.size() << " blocks, "
                      << layout.tables.size() << " tables, "
                      << (layout.outline ? layout.outline->size() : 0) << " outline entries"
                      << std::endl;
        }

        if (!layout.outline && !layout.blocks.empty()) {
            std::cerr << "[DocumentChunker::chunk_pdf] Warning: no outline from layout engine, "
                      << "inferring headings from bullet patterns" << std::endl;
        }

        HeadingLevels headings = infer_heading_levels(layout.blocks, layout.outline);
        std::vector<int> sections = assign_sections(headings);

        std::vector<MergeItem> items;
        items.reserve(layout.blocks.size() + layout.tables.size());
        for (size_t i = 0; i < layout.blocks.size(); ++i) {
            items.push_back({layout.blocks[i].text, sections[i], layout.blocks[i].geometry});
        }

        std::vector<Table> tables = TableNormalizer::normalize_all(layout.tables);
        for (const auto& table : tables) {
            items.push_back({table.markup, kTableSectionId, table.geometry});
        }

        ChunkMerger merger(*tokenizer_, options_.merge);
        std::vector<Chunk> chunks = merger.merge(std::move(items));

        std::vector<IndexRecord> records = table_records(tables, meta);
        for (auto& chunk : chunks) {
            if (text::trim(chunk.text).empty()) continue;
            Geometry positions = non_zero(chunk.geometry);
            records.push_back(make_record(RecordKind::Text, std::move(chunk.text), std::move(positions), meta));
        }
        return records;
    }

    std::vector<IndexRecord> chunk_docx(const DocumentInput& input, const DocumentMeta& meta,
                                        const ProgressCallback& progress) const {
        const std::string& recognizer = input.config.layout_recognize;

        VisionModel* vision = nullptr;
        if (!is_builtin_recognizer(recognizer)) {
            if (vision_model_) {
                vision = vision_model_.get();
                report(progress, 0.05, "Using " + recognizer + " for image processing in DOCX.");
            } else if (options_.verbose) {
                std::cout << "[DocumentChunker::chunk_docx] Vision model " << recognizer
                          << " not available, keeping images" << std::endl;
            }
        }

        DocxReader reader;
        DocxDocument docx = input.bytes.empty() ? reader.read(input.path) : reader.read(input.bytes);

        QaReconstructor reconstructor(vision);
        std::vector<QaUnit> units = reconstructor.reconstruct(docx.paragraphs, input.from_page, input.to_page);

        std::vector<IndexRecord> records = table_records(TableNormalizer::normalize_all(docx.tables), meta);
        for (auto& unit : units) {
            RecordKind kind = unit.image ? RecordKind::Image : RecordKind::Text;
            IndexRecord record = make_record(kind, unit.text(), {}, meta);
            record.image = std::move(unit.image);
            records.push_back(std::move(record));
        }
        return records;
    }

    std::vector<IndexRecord> table_records(const std::vector<Table>& tables, const DocumentMeta& meta) const {
        std::vector<IndexRecord> records;
        records.reserve(tables.size());
        for (const auto& table : tables) {
            records.push_back(make_record(RecordKind::Table, table.markup, non_zero(table.geometry), meta));
        }
        return records;
    }

    IndexRecord make_record(RecordKind kind, std::string content, Geometry positions,
                            const DocumentMeta& meta) const {
        IndexRecord record;
        record.kind = kind;
        record.token_count = tokenizer_->count_tokens(content);
        record.content = std::move(content);
        record.positions = std::move(positions);
        record.doc_name = meta.doc_name;
        record.title = meta.title;
        record.english = meta.english;
        return record;
    }

    ChunkerOptions options_;
    ThreadPool thread_pool_;
    mutable std::mutex stats_mutex_;
    nlohmann::json stats_;
};

DocumentChunker::DocumentChunker(const ChunkerOptions& options)
    : pImpl(std::make_unique<Impl>(options)) {}

DocumentChunker::~DocumentChunker() = default;

void DocumentChunker::set_tokenizer(std::shared_ptr<Tokenizer> tokenizer) {
    if (!tokenizer) {
        throw std::invalid_argument("Tokenizer must not be null");
    }
    pImpl->tokenizer_ = std::move(tokenizer);
}

void DocumentChunker::set_vision_model(std::shared_ptr<VisionModel> model) {
    pImpl->vision_model_ = std::move(model);
}

void DocumentChunker::set_layout_engine_factory(LayoutEngineFactory factory) {
    pImpl->engine_factory_ = std::move(factory);
}

std::vector<IndexRecord> DocumentChunker::chunk(const DocumentInput& input,
                                                const ProgressCallback& progress) {
    return pImpl->chunk(input, progress);
}

std::vector<ChunkingResult> DocumentChunker::chunk_batch(const std::vector<DocumentInput>& inputs,
                                                         const BatchProgressCallback& progress) {
    return pImpl->chunk_batch(inputs, progress);
}

nlohmann::json DocumentChunker::get_stats() const {
    return pImpl->get_stats();
}

std::unique_ptr<LayoutEngine> DocumentChunker::make_layout_engine(const std::string& layout_recognize,
                                                                  std::shared_ptr<VisionModel> model) {
    if (layout_recognize == kDeepDoc) {
        return std::make_unique<MuPdfLayoutEngine>();
    }
    if (layout_recognize == kPlainText) {
        return std::make_unique<PlainTextLayoutEngine>();
    }
    return std::make_unique<VisionLayoutEngine>(std::move(model), layout_recognize);
}

} // namespace layout_chunker
