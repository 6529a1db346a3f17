#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "PathSanitizer.hpp"

struct DirectoryEntry {
    std::string name;
    bool isDirectory = false;
    std::optional<std::uintmax_t> size;  // files only
    bool hidden = false;
};

class DirectoryLister {
public:
    explicit DirectoryLister(const PathSanitizer& sanitizer);

    // Immediate children of `path`, sorted by name. Dot-names are skipped
    // unless includeHidden is set.
    std::vector<DirectoryEntry> list(const std::string& path, bool includeHidden = false) const;

private:
    const PathSanitizer& sanitizer_;
};
