#include "MappedFile.hpp"
#include <filesystem>

namespace bip = boost::interprocess;

MappedFile::MappedFile(const std::string& path)
    : size_(static_cast<size_t>(std::filesystem::file_size(path))) {
    if (size_ > 0) {
        fileMapping_ = bip::file_mapping(path.c_str(), bip::read_only);
        region_ = bip::mapped_region(fileMapping_, bip::read_only, 0, size_);
    }
}

const char* MappedFile::data() const {
    if (size_ == 0) {
        return "";
    }
    return static_cast<const char*>(region_.get_address());
}
