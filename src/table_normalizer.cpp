#include "layout_chunker/table_normalizer.h"
#include "layout_chunker/text_utils.h"

namespace layout_chunker {

std::vector<TableCell> TableNormalizer::collapse_row(const std::vector<std::string>& cells) {
    std::vector<TableCell> row;

    size_t i = 0;
    while (i < cells.size()) {
        TableCell cell{cells[i], 1};
        size_t j = i + 1;
        while (j < cells.size() && cells[j] == cells[i]) {
            cell.colspan++;
            j++;
        }
        row.push_back(std::move(cell));
        i = j;
    }

    return row;
}

std::string TableNormalizer::to_markup(const std::vector<std::vector<TableCell>>& rows) {
    std::string html = "<table>";
    for (const auto& row : rows) {
        html += "<tr>";
        for (const auto& cell : row) {
            if (cell.colspan == 1) {
                html += "<td>";
            } else {
                html += "<td colspan='" + std::to_string(cell.colspan) + "'>";
            }
            html += text::html_escape(cell.text);
            html += "</td>";
        }
        html += "</tr>";
    }
    html += "</table>";
    return html;
}

bool TableNormalizer::has_text(const TableGrid& grid) {
    for (const auto& row : grid.rows) {
        for (const auto& cell : row) {
            if (!text::trim(cell).empty()) return true;
        }
    }
    return false;
}

std::optional<Table> TableNormalizer::normalize(const TableGrid& grid) {
    if (!has_text(grid)) {
        return std::nullopt;
    }

    std::vector<std::vector<TableCell>> rows;
    rows.reserve(grid.rows.size());
    for (const auto& row : grid.rows) {
        rows.push_back(collapse_row(row));
    }

    Table table;
    table.markup = to_markup(rows);
    table.geometry = grid.geometry;
    return table;
}

std::vector<Table> TableNormalizer::normalize_all(const std::vector<TableGrid>& grids) {
    std::vector<Table> tables;
    for (const auto& grid : grids) {
        if (auto table = normalize(grid)) {
            tables.push_back(std::move(*table));
        }
    }
    return tables;
}

} // namespace layout_chunker
