#pragma once

#include <string>
#include <vector>

namespace layout_chunker {
namespace text {

// UTF-8 <-> wide (UTF-32 on Linux) conversion through MuPDF runes. Each invalid
// byte decodes to U+FFFD and decoding continues after it.
std::wstring to_wide(const std::string& utf8);
std::string to_utf8(const std::wstring& wide);

std::string trim(const std::string& value);
std::wstring trim(const std::wstring& value);

std::string to_lower(std::string value);

// Collapses runs of two or more tabs/spaces/ideographic spaces into one space
// and trims the result.
std::string collapse_spaces(const std::string& value);

// Replaces U+3000 with a plain space, then trims
std::string normalize_heading(const std::string& value);

std::string html_escape(const std::string& value);

// Number of whitespace-separated words
size_t word_count(const std::string& value);

std::string file_extension(const std::string& filename);
std::string strip_extension(const std::string& filename);

} // namespace text
} // namespace layout_chunker
