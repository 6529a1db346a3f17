#pragma once
#include <filesystem>
#include <string>

// Resolves caller-supplied paths against a fixed base directory and rejects
// anything that lands outside it. The base is canonicalized once on
// construction and never changes afterwards. Absolute paths may be spelled
// with either the configured base or its canonical form.
class PathSanitizer {
public:
    explicit PathSanitizer(const std::filesystem::path& baseDir);

    // Returns the lexically normalized absolute path for `candidate`.
    // Throws ToolError(AccessDenied) if it is not at or under the base,
    // either lexically or after following symlinks.
    std::filesystem::path resolve(const std::string& candidate) const;

    bool contains(const std::filesystem::path& path) const;

    // Path relative to the base with '/' separators ("." for the base itself).
    std::string relative(const std::filesystem::path& path) const;

    const std::filesystem::path& base() const { return base_; }

private:
    static std::filesystem::path normalize(const std::filesystem::path& path);
    static bool isUnder(const std::filesystem::path& root, const std::filesystem::path& path);

    // Maps a path spelled under the configured base onto the canonical base.
    std::filesystem::path rebase(const std::filesystem::path& normalized) const;

    std::filesystem::path base_;
    std::filesystem::path configuredBase_;
};
