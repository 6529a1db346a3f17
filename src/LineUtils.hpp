#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

struct LineRange {
    size_t start;   // byte offset of the first character
    size_t length;  // line length without its terminator
};

// Split text into physical lines. "\n", "\r\n" and a lone "\r" each end one
// line. A trailing terminator does not open an extra empty line, so "a\n"
// yields one line and "" yields none.
std::vector<LineRange> split_lines(const char* data, size_t total_size);

// Strip leading and trailing ASCII whitespace.
std::string_view trim_whitespace(std::string_view text);

// True if `text` is well-formed UTF-8 (no overlongs, surrogates or code
// points above U+10FFFF).
bool is_valid_utf8(std::string_view text);
