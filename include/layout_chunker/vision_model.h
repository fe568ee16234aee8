#pragma once

#include "layout_chunker/image.h"
#include <string>

namespace layout_chunker {

// Image-to-text collaborator. Implementations may block; failures are
// reported by throwing.
class VisionModel {
public:
    virtual ~VisionModel() = default;
    virtual std::string describe(const Image& image, const std::string& prompt) = 0;
};

// Prompt used for images embedded in DOCX paragraphs
extern const char* const kImageExtractionPrompt;

// Prompt used for a rendered PDF page (1-based page number)
std::string page_transcription_prompt(int page_number);

} // namespace layout_chunker
