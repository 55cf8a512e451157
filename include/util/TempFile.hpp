#pragma once

#include <filesystem>

namespace ib::util {

// Owns a file on disk; removes it on release() or destruction, whichever comes first.
class TempFile {
public:
    TempFile() = default;
    explicit TempFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFile() { release(); }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    TempFile(TempFile&& other) noexcept : path_(std::move(other.path_)) { other.path_.clear(); }
    TempFile& operator=(TempFile&& other) noexcept {
        if (this != &other) {
            release();
            path_ = std::move(other.path_);
            other.path_.clear();
        }
        return *this;
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool owns() const noexcept { return !path_.empty(); }
    explicit operator bool() const noexcept { return owns(); }

    // Deletes the file; safe to call repeatedly.
    void release() noexcept {
        if (path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        path_.clear();
    }

private:
    std::filesystem::path path_{};
};

}
