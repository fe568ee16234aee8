#pragma once

#include <string>
#include <vector>
#include <stdexcept>

namespace layout_chunker {

// One positioned fragment of a block. Page numbers are 1-based and relative
// to the first requested page; all-zero means the source had no geometry.
struct Position {
    int page = 0;
    double left = 0.0;
    double right = 0.0;
    double top = 0.0;
    double bottom = 0.0;

    bool is_zero() const {
        return page == 0 && left == 0.0 && right == 0.0 && top == 0.0 && bottom == 0.0;
    }
};

using Geometry = std::vector<Position>;

// A unit of extracted text as handed over by a layout engine
struct Block {
    std::string text;
    std::string layout_label;
    Geometry geometry;
};

struct OutlineEntry {
    std::string text;
    int level = 0;
};

// Raw table before normalization: one string per grid cell
struct TableGrid {
    std::vector<std::vector<std::string>> rows;
    Geometry geometry;
};

// Normalized table, merged downstream under section id -1
struct Table {
    std::string markup;
    Geometry geometry;
};

constexpr int kTableSectionId = -1;

// Broken data contract between pipeline stages (e.g. one level per block)
class StructuralError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class UnsupportedFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace layout_chunker
