#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

// Scratch directory under the system temp dir, removed on destruction.
class TempTree {
public:
    explicit TempTree(const std::string& name)
        : root_(std::filesystem::temp_directory_path() /
                ("mcpfs_" + name + "_" + std::to_string(::getpid()))) {
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
        root_ = std::filesystem::canonical(root_);
    }
    ~TempTree() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path write(const std::string& rel, const std::string& content) const {
        auto path = root_ / rel;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream ofs(path, std::ios::binary);
        ofs << content;
        return path;
    }

    std::filesystem::path mkdir(const std::string& rel) const {
        auto path = root_ / rel;
        std::filesystem::create_directories(path);
        return path;
    }

private:
    std::filesystem::path root_;
};
