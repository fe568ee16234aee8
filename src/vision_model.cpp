#include "layout_chunker/vision_model.h"

namespace layout_chunker {

const char* const kImageExtractionPrompt =
    "Extract the layout of this image and output only its text content as Markdown.\n"
    "\n"
    "1. Ignore bounding boxes and coordinates.\n"
    "2. By category:\n"
    "   - Picture: no text.\n"
    "   - Formula: LaTeX, enclosed in $ or $$.\n"
    "   - Table: a complete HTML table using <table>, <tr>, <td>, <th>, keeping all data and structure.\n"
    "   - Everything else (text, title, caption, ...): Markdown.\n"
    "3. Keep the original text, do not translate it.\n"
    "4. Order all elements the way a person would read them.\n"
    "5. Write tables without superfluous spaces or newlines.\n"
    "\n"
    "Output a single Markdown document.";

std::string page_transcription_prompt(int page_number) {
    return std::string("This is page ") + std::to_string(page_number) +
           " of a document.\n" + kImageExtractionPrompt;
}

} // namespace layout_chunker
