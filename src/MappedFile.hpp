#pragma once
#include <string>
#include <string_view>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

// Read-only view of a whole file. Empty files are not mapped (a zero-length
// mapping is rejected by the OS) and expose an empty view.
class MappedFile {
public:
    explicit MappedFile(const std::string& path);

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    size_t size() const { return size_; }
    const char* data() const;
    std::string_view view() const { return std::string_view(data(), size_); }

private:
    boost::interprocess::file_mapping fileMapping_;
    boost::interprocess::mapped_region region_;
    size_t size_;
};
