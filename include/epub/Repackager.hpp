#pragma once

#include "util/TempFile.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace ib::epub {

class ZipReader;

inline constexpr const char* MIMETYPE_ENTRY = "mimetype";
inline constexpr const char* EPUB_MIMETYPE = "application/epub+zip";

struct Prepared {
    std::filesystem::path upload_path;
    util::TempFile owned_temp{};     // empty when upload_path is the caller's own file
};

/**
 * Rewrites EPUB archives into the framing the tablet firmware accepts:
 * `mimetype` first, stored, and without extra fields or data descriptors.
 * Every other entry is copied deflated in source order.
 */
class Repackager {
public:
    static Prepared prepare(const std::filesystem::path& path, bool injectCover);

    // container.xml rootfile, else the first *.opf entry
    static std::optional<std::string> locatePackageDocument(const ZipReader& zip);
};

}
