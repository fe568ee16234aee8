#include "layout_chunker/geometry.h"
#include <cmath>
#include <sstream>

namespace layout_chunker {

std::string format_one_decimal(double value) {
    long long tenths = std::llround(value * 10.0);
    bool negative = tenths < 0;
    if (negative) tenths = -tenths;

    std::ostringstream out;
    if (negative) out << '-';
    out << tenths / 10 << '.' << tenths % 10;
    return out.str();
}

std::string position_tag(const Position& pos) {
    if (pos.is_zero()) {
        return "";
    }

    std::ostringstream tag;
    tag << "@@" << pos.page
        << '\t' << format_one_decimal(pos.left)
        << '\t' << format_one_decimal(pos.right)
        << '\t' << format_one_decimal(pos.top)
        << '\t' << format_one_decimal(pos.bottom)
        << "##";
    return tag.str();
}

std::string geometry_tags(const Geometry& geometry) {
    std::string tags;
    for (size_t i = 0; i < geometry.size(); ++i) {
        if (i > 0) tags += '\t';
        tags += position_tag(geometry[i]);
    }
    return tags;
}

} // namespace layout_chunker
