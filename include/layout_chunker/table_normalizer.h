#pragma once

#include "layout_chunker/types.h"
#include <optional>
#include <string>
#include <vector>

namespace layout_chunker {

struct TableCell {
    std::string text;
    int colspan = 1;
};

class TableNormalizer {
public:
    // Consecutive cells with identical text become one cell spanning them
    static std::vector<TableCell> collapse_row(const std::vector<std::string>& cells);

    // <table><tr><td>..</td><td colspan='2'>..</td></tr></table>
    static std::string to_markup(const std::vector<std::vector<TableCell>>& rows);

    // nullopt when no cell carries any text
    static std::optional<Table> normalize(const TableGrid& grid);

    static std::vector<Table> normalize_all(const std::vector<TableGrid>& grids);

    static bool has_text(const TableGrid& grid);
};

} // namespace layout_chunker
