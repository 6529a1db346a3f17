#include "LineUtils.hpp"
#include <cstddef>

std::vector<LineRange> split_lines(const char* data, size_t total_size) {
	std::vector<LineRange> lines;
	size_t pos = 0;

	while (pos < total_size) {
		size_t start = pos;
		// advance to the end of current line (consume characters until newline)
		while (pos < total_size && data[pos] != '\n' && data[pos] != '\r') ++pos;
		lines.push_back(LineRange{start, pos - start});
		if (pos < total_size) {
			// "\r\n" is a single terminator; "\n\r" is two
			char ch = data[pos++];
			if (ch == '\r' && pos < total_size && data[pos] == '\n') ++pos;
		}
	}
	return lines;
}

std::string_view trim_whitespace(std::string_view text) {
	const char* ws = " \t\n\r\f\v";
	size_t first = text.find_first_not_of(ws);
	if (first == std::string_view::npos) {
		return std::string_view();
	}
	size_t last = text.find_last_not_of(ws);
	return text.substr(first, last - first + 1);
}

bool is_valid_utf8(std::string_view text) {
	size_t i = 0;
	const size_t n = text.size();
	while (i < n) {
		unsigned char c = static_cast<unsigned char>(text[i]);
		if (c < 0x80) {
			++i;
			continue;
		}
		size_t extra = 0;
		unsigned int cp = 0;
		unsigned int min = 0;
		if ((c & 0xE0) == 0xC0) {
			extra = 1; cp = c & 0x1F; min = 0x80;
		} else if ((c & 0xF0) == 0xE0) {
			extra = 2; cp = c & 0x0F; min = 0x800;
		} else if ((c & 0xF8) == 0xF0) {
			extra = 3; cp = c & 0x07; min = 0x10000;
		} else {
			return false;
		}
		if (i + extra >= n) {
			return false;
		}
		for (size_t k = 1; k <= extra; ++k) {
			unsigned char cc = static_cast<unsigned char>(text[i + k]);
			if ((cc & 0xC0) != 0x80) return false;
			cp = (cp << 6) | (cc & 0x3F);
		}
		if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
			return false;
		}
		i += extra + 1;
	}
	return true;
}
