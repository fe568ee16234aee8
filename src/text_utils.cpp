#include "layout_chunker/text_utils.h"
#include <mupdf/fitz.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace layout_chunker {
namespace text {

std::wstring to_wide(const std::string& utf8) {
    std::wstring out;
    out.reserve(utf8.size());

    // fz_chartorune yields FZ_REPLACEMENT_CHARACTER for a bad or truncated
    // sequence and consumes one byte, so decoding resumes at the next byte.
    const char* data = utf8.c_str();
    size_t i = 0;
    while (i < utf8.size()) {
        int rune = 0;
        int consumed = fz_chartorune(&rune, data + i);
        out.push_back(static_cast<wchar_t>(rune));
        i += consumed > 0 ? static_cast<size_t>(consumed) : 1;
    }

    return out;
}

std::string to_utf8(const std::wstring& wide) {
    std::string out;
    out.reserve(wide.size());

    char buf[FZ_UTFMAX];
    for (wchar_t wc : wide) {
        int n = fz_runetochar(buf, static_cast<int>(wc));
        out.append(buf, static_cast<size_t>(n));
    }

    return out;
}

std::string trim(const std::string& value) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

std::wstring trim(const std::wstring& value) {
    const auto is_space = [](wchar_t c) {
        return c == L' ' || c == L'\t' || c == L'\n' || c == L'\r' ||
               c == L'\f' || c == L'\v' || c == 0x3000;
    };
    auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (begin >= end) return {};
    return std::wstring(begin, end);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string collapse_spaces(const std::string& value) {
    std::wstring wide = trim(to_wide(value));
    std::wstring out;
    out.reserve(wide.size());

    const auto is_blank = [](wchar_t c) { return c == L'\t' || c == L' ' || c == 0x3000; };

    size_t i = 0;
    while (i < wide.size()) {
        if (!is_blank(wide[i])) {
            out.push_back(wide[i++]);
            continue;
        }
        size_t run = i;
        while (run < wide.size() && is_blank(wide[run])) ++run;
        if (run - i >= 2) {
            out.push_back(L' ');
        } else {
            out.push_back(wide[i]);
        }
        i = run;
    }

    return to_utf8(out);
}

std::string normalize_heading(const std::string& value) {
    std::wstring wide = to_wide(value);
    std::replace(wide.begin(), wide.end(), static_cast<wchar_t>(0x3000), L' ');
    return to_utf8(trim(wide));
}

std::string html_escape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

size_t word_count(const std::string& value) {
    std::istringstream stream(value);
    std::string word;
    size_t count = 0;
    while (stream >> word) {
        count++;
    }
    return count;
}

std::string file_extension(const std::string& filename) {
    auto dot = filename.find_last_of('.');
    auto slash = filename.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    return to_lower(filename.substr(dot + 1));
}

std::string strip_extension(const std::string& filename) {
    auto dot = filename.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == filename.size()) {
        return filename;
    }
    bool alpha = std::all_of(filename.begin() + dot + 1, filename.end(),
                             [](unsigned char c) { return std::isalpha(c) != 0; });
    return alpha ? filename.substr(0, dot) : filename;
}

} // namespace text
} // namespace layout_chunker
