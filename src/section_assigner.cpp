#include "layout_chunker/section_assigner.h"

namespace layout_chunker {

std::vector<int> assign_sections(const HeadingLevels& headings) {
    const auto& levels = headings.levels;
    std::vector<int> section_ids;
    section_ids.reserve(levels.size());

    int section_id = 0;
    for (size_t i = 0; i < levels.size(); ++i) {
        if (i > 0 && levels[i] <= headings.pivot_level && levels[i] != levels[i - 1]) {
            section_id++;
        }
        section_ids.push_back(section_id);
    }

    return section_ids;
}

} // namespace layout_chunker
