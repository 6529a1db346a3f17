#include "DirectoryLister.hpp"
#include "ToolError.hpp"
#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

DirectoryLister::DirectoryLister(const PathSanitizer& sanitizer)
    : sanitizer_(sanitizer) {}

std::vector<DirectoryEntry> DirectoryLister::list(const std::string& path, bool includeHidden) const {
    spdlog::debug("Attempting to list directory at path: {}", path);
    fs::path dir = sanitizer_.resolve(path);

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        spdlog::error("Directory does not exist: {}", dir.string());
        throw ToolError(ErrorKind::NotFound, "Directory does not exist: " + path);
    }

    std::vector<DirectoryEntry> entries;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw ToolError(ErrorKind::IoFailure, "Failed to list directory: " + path + ": " + ec.message());
    }
    for (const auto& item : it) {
        DirectoryEntry entry;
        entry.name = item.path().filename().string();
        entry.hidden = !entry.name.empty() && entry.name.front() == '.';
        if (entry.hidden && !includeHidden) {
            continue;
        }

        // status() follows symlinks, so a link to a directory lists as one
        std::error_code statusEc;
        entry.isDirectory = item.is_directory(statusEc);
        if (!entry.isDirectory) {
            std::error_code sizeEc;
            std::uintmax_t size = fs::file_size(item.path(), sizeEc);
            if (!sizeEc) {
                entry.size = size;
            }
        }
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) {
        return a.name < b.name;
    });
    spdlog::debug("Listed {} entries in {}", entries.size(), path);
    return entries;
}
