#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "PathSanitizer.hpp"

struct LineMatch {
    size_t lineNumber;  // 1-based
    std::string content;
};

struct SearchResult {
    std::string path;  // relative to the base directory
    std::uintmax_t size = 0;
    std::optional<std::vector<LineMatch>> matches;  // set only for content searches
};

struct SearchRequest {
    std::string pattern;
    std::string searchPath = ".";
    bool recursive = true;
    std::optional<std::string> contentRegex;
};

class FileSearch {
public:
    // Called after each candidate file with (files done, files total).
    using ProgressCallback = std::function<void(size_t, size_t)>;

    FileSearch(const PathSanitizer& sanitizer, std::uintmax_t maxBytes);

    std::vector<SearchResult> search(const SearchRequest& request, ProgressCallback progress = nullptr) const;

    // Glob match of a '/'-separated relative path. When `anyDepth` is set the
    // pattern may also match after any number of leading directories.
    static bool globMatch(const std::string& pattern, const std::string& relativePath, bool anyDepth);

private:
    const PathSanitizer& sanitizer_;
    std::uintmax_t maxBytes_;
};
