#pragma once

#include "layout_chunker/heading_classifier.h"
#include <vector>

namespace layout_chunker {

// Turns per-block levels into section ids starting at 0. A new section starts
// at a block whose level is at or above the pivot and differs from the level
// of the block before it.
std::vector<int> assign_sections(const HeadingLevels& headings);

} // namespace layout_chunker
