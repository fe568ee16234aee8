#pragma once

#include "layout_chunker/chunk_merger.h"
#include "layout_chunker/image.h"
#include "layout_chunker/layout_engine.h"
#include "layout_chunker/tokenizer.h"
#include "layout_chunker/types.h"
#include "layout_chunker/vision_model.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace layout_chunker {

struct ParserConfig {
    int chunk_token_num = 512;                      // advisory, passed through
    std::string delimiter = "\n!?。；！？";          // passed through
    std::string layout_recognize = "DeepDOC";       // "DeepDOC", "Plain Text" or a vision model name
};

struct DocumentInput {
    std::string name;                   // file name; its extension selects the format
    std::string path;                   // read when bytes is empty
    std::vector<uint8_t> bytes;
    int from_page = 0;
    int to_page = 100000;
    std::string lang = "Chinese";
    ParserConfig config;
};

enum class RecordKind {
    Text,
    Table,
    Image
};

// One retrieval unit ready for indexing
struct IndexRecord {
    RecordKind kind = RecordKind::Text;
    std::string content;
    Geometry positions;
    std::optional<Image> image;
    std::string doc_name;
    std::string title;          // doc_name without its extension
    bool english = false;
    size_t token_count = 0;
};

struct ChunkingResult {
    std::string doc_name;
    std::vector<IndexRecord> records;
    std::string error;
    bool success = false;
    double processing_time_ms = 0.0;
};

struct ChunkerOptions {
    size_t thread_count = std::thread::hardware_concurrency();
    bool verbose = false;
    std::string vocabulary_path;        // .tiktoken file; empty uses the estimator
    MergeOptions merge;
};

using LayoutEngineFactory = std::function<std::unique_ptr<LayoutEngine>(const std::string& layout_recognize)>;
using BatchProgressCallback = std::function<void(size_t completed, size_t total)>;

class DocumentChunker {
public:
    explicit DocumentChunker(const ChunkerOptions& options = ChunkerOptions{});
    ~DocumentChunker();

    // Replaces the tokenizer chosen from ChunkerOptions::vocabulary_path
    void set_tokenizer(std::shared_ptr<Tokenizer> tokenizer);

    // Used for non-DeepDOC/"Plain Text" recognizers: page transcription of
    // PDFs and image description in DOCX. Must tolerate concurrent calls when
    // chunk_batch is used.
    void set_vision_model(std::shared_ptr<VisionModel> model);

    // Overrides how layout recognizer names map to engines
    void set_layout_engine_factory(LayoutEngineFactory factory);

    // Throws UnsupportedFormatError for anything but .pdf/.docx, before reading
    std::vector<IndexRecord> chunk(const DocumentInput& input,
                                   const ProgressCallback& progress = nullptr);

    // Documents run concurrently; results keep input order and a failed
    // document only sets its own error
    std::vector<ChunkingResult> chunk_batch(const std::vector<DocumentInput>& inputs,
                                            const BatchProgressCallback& progress = nullptr);

    nlohmann::json get_stats() const;

    // "DeepDOC" -> MuPdfLayoutEngine, "Plain Text" -> PlainTextLayoutEngine,
    // any other name -> VisionLayoutEngine over model
    static std::unique_ptr<LayoutEngine> make_layout_engine(const std::string& layout_recognize,
                                                            std::shared_ptr<VisionModel> model);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

const char* to_string(RecordKind kind);

} // namespace layout_chunker
