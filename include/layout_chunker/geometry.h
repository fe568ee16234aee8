#pragma once

#include "layout_chunker/types.h"
#include <string>

namespace layout_chunker {

// Inline position tag: "@@page\tleft\tright\ttop\tbottom##", spatial fields
// with one fractional digit (ties rounded away from zero). Empty string for
// an all-zero position.
std::string position_tag(const Position& pos);

// Tags of every fragment, joined with '\t'
std::string geometry_tags(const Geometry& geometry);

// Formats with exactly one fractional digit, ties away from zero: 10.25 -> "10.3"
std::string format_one_decimal(double value);

} // namespace layout_chunker
