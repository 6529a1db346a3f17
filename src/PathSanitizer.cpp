#include "PathSanitizer.hpp"
#include "ToolError.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

PathSanitizer::PathSanitizer(const fs::path& baseDir) {
    std::error_code ec;
    fs::path absolute = fs::absolute(baseDir, ec);
    if (ec) {
        throw ToolError(ErrorKind::NotFound, "Base directory is not accessible: " + baseDir.string());
    }
    fs::path canonical = fs::canonical(absolute, ec);
    if (ec || !fs::is_directory(canonical)) {
        throw ToolError(ErrorKind::NotFound, "Base directory does not exist: " + baseDir.string());
    }
    base_ = canonical;
    configuredBase_ = normalize(absolute);
}

fs::path PathSanitizer::normalize(const fs::path& path) {
    fs::path normalized = path.lexically_normal();
    // "a/b/" normalizes to "a/b/" with an empty filename; drop it so the
    // component comparison below sees the same segments as "a/b".
    if (!normalized.has_filename() && normalized.has_relative_path()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}

bool PathSanitizer::isUnder(const fs::path& root, const fs::path& path) {
    auto r = root.begin();
    auto p = path.begin();
    for (; r != root.end(); ++r, ++p) {
        if (p == path.end() || *r != *p) {
            return false;
        }
    }
    return true;
}

fs::path PathSanitizer::rebase(const fs::path& normalized) const {
    if (configuredBase_ == base_ || isUnder(base_, normalized) || !isUnder(configuredBase_, normalized)) {
        return normalized;
    }
    return normalize(base_ / normalized.lexically_relative(configuredBase_));
}

bool PathSanitizer::contains(const fs::path& path) const {
    return isUnder(base_, rebase(normalize(path)));
}

fs::path PathSanitizer::resolve(const std::string& candidate) const {
    fs::path requested(candidate.empty() ? std::string(".") : candidate);
    if (!requested.is_absolute()) {
        requested = base_ / requested;
    }
    fs::path normalized = rebase(normalize(requested));

    if (!isUnder(base_, normalized)) {
        spdlog::warn("Attempted access outside base directory: {}", candidate);
        throw ToolError(ErrorKind::AccessDenied,
                        "Access denied: " + candidate + " is outside " + base_.string());
    }

    // Follow symlinks for the part of the path that exists.
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(normalized, ec);
    if (!ec && !isUnder(base_, resolved)) {
        spdlog::warn("Symlink escape outside base directory: {} -> {}", candidate, resolved.string());
        throw ToolError(ErrorKind::AccessDenied,
                        "Access denied: " + candidate + " resolves outside " + base_.string());
    }
    return normalized;
}

std::string PathSanitizer::relative(const fs::path& path) const {
    fs::path normalized = rebase(normalize(path));
    fs::path rel = normalized.lexically_relative(base_);
    if (rel.empty()) {
        return normalized.generic_string();
    }
    return rel.generic_string();
}
