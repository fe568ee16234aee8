#pragma once

#include "layout_chunker/types.h"
#include "layout_chunker/vision_model.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace layout_chunker {

// A document handed to the pipeline, by path or as an in-memory buffer
struct DocumentSource {
    std::string name;
    std::string path;               // used when bytes is empty
    std::vector<uint8_t> bytes;

    bool in_memory() const { return !bytes.empty(); }
};

// Zero-based, half-open page interval
struct PageRange {
    int from = 0;
    int to = 100000;
};

struct LayoutResult {
    std::vector<Block> blocks;
    std::vector<TableGrid> tables;
    std::optional<std::vector<OutlineEntry>> outline;   // nullopt: engine exposes none
};

// progress in [0, 1]; a negative value carries a message only
using ProgressCallback = std::function<void(double progress, const std::string& message)>;

class LayoutEngine {
public:
    virtual ~LayoutEngine() = default;

    virtual std::string name() const = 0;

    // Blocks in reading order with 1-based page numbers relative to range.from
    virtual LayoutResult extract(const DocumentSource& source, const PageRange& range,
                                 const ProgressCallback& progress) = 0;
};

// Structured-text extraction: one block per MuPDF text block, short bold or
// oversized blocks labelled "title", PDF outline as heading hints.
class MuPdfLayoutEngine : public LayoutEngine {
public:
    MuPdfLayoutEngine();
    ~MuPdfLayoutEngine() override;

    std::string name() const override { return "DeepDOC"; }
    LayoutResult extract(const DocumentSource& source, const PageRange& range,
                         const ProgressCallback& progress) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// One block per text line, without geometry
class PlainTextLayoutEngine : public LayoutEngine {
public:
    PlainTextLayoutEngine();
    ~PlainTextLayoutEngine() override;

    std::string name() const override { return "Plain Text"; }
    LayoutResult extract(const DocumentSource& source, const PageRange& range,
                         const ProgressCallback& progress) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Renders each page and transcribes it with a vision model: one block per page
class VisionLayoutEngine : public LayoutEngine {
public:
    VisionLayoutEngine(std::shared_ptr<VisionModel> model, std::string name);
    ~VisionLayoutEngine() override;

    std::string name() const override { return name_; }
    LayoutResult extract(const DocumentSource& source, const PageRange& range,
                         const ProgressCallback& progress) override;

private:
    std::shared_ptr<VisionModel> model_;
    std::string name_;
};

} // namespace layout_chunker
