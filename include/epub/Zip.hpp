#pragma once

#include <deque>
#include <filesystem>
#include <string>
#include <vector>
#include <zip.h>

namespace ib::epub {

struct ZipEntryInfo {
    std::string name;
    bool is_dir{false};
};

// Read-only view over an archive on disk.
class ZipReader {
public:
    explicit ZipReader(const std::filesystem::path& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    [[nodiscard]] std::vector<ZipEntryInfo> entries() const;
    [[nodiscard]] bool has(const std::string& name) const;

    // Throws std::runtime_error if the entry is missing or cannot be inflated.
    [[nodiscard]] std::string read(const std::string& name) const;

private:
    zip_t* archive_{nullptr};
    std::filesystem::path path_;

    [[nodiscard]] std::string readIndex(zip_uint64_t index, const std::string& name) const;
};

enum class Compression { Store, Deflate };

/**
 * Builds a new archive entry by entry, in insertion order.
 *
 * Entry payloads are held in memory until close(), which is where libzip
 * actually writes the file. Destroying an unclosed writer discards the
 * output.
 */
class ZipWriter {
public:
    explicit ZipWriter(const std::filesystem::path& path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // Adds a file entry with no extra fields in either header.
    void add(const std::string& name, std::string data, Compression compression = Compression::Deflate);
    void addDirectory(const std::string& name);

    void close();

private:
    zip_t* archive_{nullptr};
    std::filesystem::path path_;
    std::deque<std::string> buffers_;

    [[noreturn]] void fail(const std::string& what) const;
};

}
