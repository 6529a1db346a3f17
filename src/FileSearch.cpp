#include "FileSearch.hpp"
#include "FileReader.hpp"
#include "LineUtils.hpp"
#include "ToolError.hpp"
#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fnmatch.h>
#include <boost/regex.hpp>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace {

void validatePattern(const std::string& pattern) {
    if (pattern.empty()) {
        throw ToolError(ErrorKind::InvalidInput, "Invalid glob pattern: pattern is empty");
    }
    fs::path p(pattern);
    if (p.is_absolute()) {
        throw ToolError(ErrorKind::InvalidInput, "Invalid glob pattern: must be relative: " + pattern);
    }
    for (const auto& part : p) {
        if (part == "..") {
            throw ToolError(ErrorKind::InvalidInput, "Invalid glob pattern: '..' is not allowed: " + pattern);
        }
    }
}

size_t patternDepth(const std::string& pattern) {
    return static_cast<size_t>(std::count(pattern.begin(), pattern.end(), '/'));
}

// True if some directory component of the pattern (all but the last) can
// match `name`. Used to decide whether a hidden directory may hold matches.
bool patternNamesDirectory(const std::string& pattern, const std::string& name) {
    size_t start = 0;
    for (size_t slash = pattern.find('/'); slash != std::string::npos; slash = pattern.find('/', start)) {
        std::string component = pattern.substr(start, slash - start);
        if (fnmatch(component.c_str(), name.c_str(), FNM_PERIOD) == 0) {
            return true;
        }
        start = slash + 1;
    }
    return false;
}

}  // namespace

FileSearch::FileSearch(const PathSanitizer& sanitizer, std::uintmax_t maxBytes)
    : sanitizer_(sanitizer), maxBytes_(maxBytes) {}

bool FileSearch::globMatch(const std::string& pattern, const std::string& relativePath, bool anyDepth) {
    const int flags = FNM_PATHNAME | FNM_PERIOD;
    if (fnmatch(pattern.c_str(), relativePath.c_str(), flags) == 0) {
        return true;
    }
    if (!anyDepth) {
        return false;
    }
    for (size_t slash = relativePath.find('/'); slash != std::string::npos;
         slash = relativePath.find('/', slash + 1)) {
        if (fnmatch(pattern.c_str(), relativePath.c_str() + slash + 1, flags) == 0) {
            return true;
        }
    }
    return false;
}

std::vector<SearchResult> FileSearch::search(const SearchRequest& request, ProgressCallback progress) const {
    spdlog::debug("Searching for files matching pattern: {} in {}", request.pattern, request.searchPath);
    validatePattern(request.pattern);

    // Compile before touching the filesystem so a bad regex fails the whole call
    std::optional<boost::regex> regex;
    if (request.contentRegex) {
        try {
            regex.emplace(*request.contentRegex, boost::regex::perl);
        } catch (const boost::regex_error& e) {
            throw ToolError(ErrorKind::InvalidInput,
                            "Invalid content regex '" + *request.contentRegex + "': " + e.what());
        }
    }

    fs::path root = sanitizer_.resolve(request.searchPath);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        spdlog::error("Search path does not exist: {}", root.string());
        throw ToolError(ErrorKind::NotFound, "Search path does not exist: " + request.searchPath);
    }

    // Glob expansion
    std::vector<fs::path> candidates;
    const size_t maxDepth = patternDepth(request.pattern);
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw ToolError(ErrorKind::IoFailure, "Failed to search " + request.searchPath + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::error("Failed to walk {}: {}", root.string(), ec.message());
            throw ToolError(ErrorKind::IoFailure, "Failed to search " + request.searchPath + ": " + ec.message());
        }
        const fs::directory_entry& entry = *it;
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            std::string name = entry.path().filename().string();
            bool hidden = !name.empty() && name.front() == '.';
            // recursive mode descends like "**", which skips hidden directories
            // unless the pattern names them; exact mode descends only as deep
            // as the pattern has components
            bool prune = request.recursive
                ? hidden && !patternNamesDirectory(request.pattern, name)
                : static_cast<size_t>(it.depth()) >= maxDepth;
            if (prune) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(typeEc)) {
            continue;
        }
        std::string rel = entry.path().lexically_relative(root).generic_string();
        if (!globMatch(request.pattern, rel, request.recursive)) {
            continue;
        }
        if (entry.is_symlink(typeEc) && !sanitizer_.contains(fs::weakly_canonical(entry.path(), typeEc))) {
            spdlog::warn("Skipping symlink that leaves the base directory: {}", entry.path().string());
            continue;
        }
        candidates.push_back(entry.path());
    }
    std::sort(candidates.begin(), candidates.end());

    std::vector<SearchResult> results;
    size_t done = 0;
    for (const auto& file : candidates) {
        ++done;
        if (progress) {
            progress(done, candidates.size());
        }

        SearchResult result;
        result.path = sanitizer_.relative(file);
        std::error_code sizeEc;
        result.size = fs::file_size(file, sizeEc);
        if (sizeEc) {
            spdlog::warn("Skipping {}: {}", file.string(), sizeEc.message());
            continue;
        }

        if (!regex) {
            results.push_back(std::move(result));
        } else {
            try {
                std::string content = FileReader::readText(file, maxBytes_);
                std::vector<LineMatch> matches;
                auto lines = split_lines(content.data(), content.size());
                for (size_t i = 0; i < lines.size(); ++i) {
                    auto first = content.cbegin() + static_cast<std::ptrdiff_t>(lines[i].start);
                    auto last = first + static_cast<std::ptrdiff_t>(lines[i].length);
                    // boost throws on runaway backtracking instead of exhausting the stack
                    if (boost::regex_search(first, last, *regex)) {
                        std::string_view line(content.data() + lines[i].start, lines[i].length);
                        matches.push_back(LineMatch{i + 1, std::string(trim_whitespace(line))});
                    }
                }
                if (!matches.empty()) {
                    result.matches = std::move(matches);
                    results.push_back(std::move(result));
                }
            } catch (const std::exception& e) {
                spdlog::warn("Could not search content in {}: {}", file.string(), e.what());
            }
        }
    }

    spdlog::debug("Found {} matching files", results.size());
    return results;
}
