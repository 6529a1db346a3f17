#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include "PathSanitizer.hpp"

class FileReader {
public:
    // maxBytes == 0 disables the size cap.
    FileReader(const PathSanitizer& sanitizer, std::uintmax_t maxBytes);

    // Whole file as UTF-8 text.
    std::string read(const std::string& path) const;

    // Reads an already validated regular file. Throws ToolError with
    // ResourceLimit if it exceeds maxBytes, IoFailure if it cannot be read
    // or is not UTF-8.
    static std::string readText(const std::filesystem::path& file, std::uintmax_t maxBytes);

private:
    const PathSanitizer& sanitizer_;
    std::uintmax_t maxBytes_;
};
