#include "FileReader.hpp"
#include "LineUtils.hpp"
#include "MappedFile.hpp"
#include "ToolError.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

FileReader::FileReader(const PathSanitizer& sanitizer, std::uintmax_t maxBytes)
    : sanitizer_(sanitizer), maxBytes_(maxBytes) {}

std::string FileReader::readText(const fs::path& file, std::uintmax_t maxBytes) {
    std::error_code ec;
    std::uintmax_t size = fs::file_size(file, ec);
    if (ec) {
        throw ToolError(ErrorKind::IoFailure, "read error: " + file.string() + ": " + ec.message());
    }
    if (maxBytes != 0 && size > maxBytes) {
        throw ToolError(ErrorKind::ResourceLimit,
                        "File too large: " + file.string() + " is " + std::to_string(size) +
                        " bytes, limit is " + std::to_string(maxBytes));
    }

    std::string content;
    try {
        MappedFile mapped(file.string());
        content.assign(mapped.data(), mapped.size());
    } catch (const std::exception& e) {
        throw ToolError(ErrorKind::IoFailure, "read error: " + file.string() + ": " + e.what());
    }

    if (!is_valid_utf8(content)) {
        throw ToolError(ErrorKind::IoFailure, "read error: " + file.string() + " is not valid UTF-8 text");
    }
    return content;
}

std::string FileReader::read(const std::string& path) const {
    spdlog::debug("Attempting to read file at path: {}", path);
    fs::path target = sanitizer_.resolve(path);

    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        spdlog::error("File does not exist: {}", target.string());
        throw ToolError(ErrorKind::NotFound, "File does not exist: " + path);
    }

    std::string content = readText(target, maxBytes_);
    spdlog::debug("Read {} bytes from {}", content.size(), path);
    return content;
}
