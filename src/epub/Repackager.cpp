#include "epub/Repackager.hpp"
#include "epub/CoverInjector.hpp"
#include "epub/Zip.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <memory>
#include <utility>
#include <pugixml.hpp>

using namespace ib::epub;
using namespace ib::log;
using namespace ib::util;

namespace {

constexpr const char* CONTAINER_PATH = "META-INF/container.xml";

std::optional<std::string> rootfileFromContainer(const std::string& xml) {
    pugi::xml_document doc;
    if (!doc.load_buffer(xml.data(), xml.size())) return std::nullopt;

    const auto rootfile = doc.find_node([](const pugi::xml_node& n) {
        const std::string_view name = n.name();
        return name == "rootfile" || name.ends_with(":rootfile");
    });
    const std::string fullPath = rootfile.attribute("full-path").value();
    if (fullPath.empty()) return std::nullopt;
    return fullPath;
}

}

std::optional<std::string> Repackager::locatePackageDocument(const ZipReader& zip) {
    if (zip.has(CONTAINER_PATH)) {
        try {
            if (auto path = rootfileFromContainer(zip.read(CONTAINER_PATH)); path && zip.has(*path)) return path;
        } catch (const std::exception& e) {
            Registry::epub()->debug("[Repackager] Unreadable {}: {}", CONTAINER_PATH, e.what());
        }
    }

    for (const auto& entry : zip.entries())
        if (!entry.is_dir && entry.name.ends_with(".opf")) return entry.name;

    return std::nullopt;
}

Prepared Repackager::prepare(const std::filesystem::path& path, const bool injectCover) {
    if (lowerExtension(path) != ".epub") return {path, {}};

    std::unique_ptr<ZipReader> src;
    std::vector<ZipEntryInfo> entries;
    try {
        src = std::make_unique<ZipReader>(path);
        entries = src->entries();
    } catch (const std::exception& e) {
        Registry::epub()->warn("[Repackager] Not a readable archive, uploading as-is: {}", e.what());
        return {path, {}};
    }

    const auto opfPath = locatePackageDocument(*src);

    std::optional<CoverPatch> patch;
    if (opfPath && injectCover) {
        try {
            const EntryLookup lookup = [&](const std::string& name) -> std::optional<std::string> {
                if (!src->has(name)) return std::nullopt;
                return src->read(name);
            };
            patch = CoverInjector::inject(src->read(*opfPath), *opfPath, lookup);
        } catch (const std::exception& e) {
            Registry::epub()->debug("[Repackager] Cover injection skipped for {}: {}", path.string(), e.what());
        }
    }

    // Read everything up front; a corrupt member means we upload the original untouched
    std::vector<std::pair<ZipEntryInfo, std::string>> members;
    members.reserve(entries.size());
    bool pageWritten = false;
    try {
        for (const auto& entry : entries) {
            if (entry.name == MIMETYPE_ENTRY) continue;
            if (entry.is_dir) {
                members.emplace_back(entry, std::string{});
                continue;
            }
            if (patch && opfPath && entry.name == *opfPath) {
                members.emplace_back(entry, patch->package_document);
                continue;
            }
            if (patch && entry.name == patch->page_path) {
                members.emplace_back(entry, std::exchange(patch->page, {}));
                pageWritten = true;
                continue;
            }
            members.emplace_back(entry, src->read(entry.name));
        }
    } catch (const std::exception& e) {
        Registry::epub()->warn("[Repackager] Failed reading {}, uploading as-is: {}", path.string(), e.what());
        return {path, {}};
    }
    src.reset();

    TempFile out(makeTempPath("epub", ".epub"));
    try {
        ZipWriter dst(out.path());
        dst.add(MIMETYPE_ENTRY, EPUB_MIMETYPE, Compression::Store);

        for (auto& [entry, data] : members) {
            if (entry.is_dir) dst.addDirectory(entry.name);
            else dst.add(entry.name, std::move(data));
        }

        if (patch && !pageWritten) dst.add(patch->page_path, std::move(patch->page));

        dst.close();
    } catch (const std::exception& e) {
        Registry::epub()->error("[Repackager] Failed writing repackaged copy of {}: {}", path.string(), e.what());
        throw;
    }

    Registry::epub()->debug("[Repackager] Prepared {} -> {}{}", path.string(), out.path().string(),
                            patch ? " (cover page injected)" : "");
    auto uploadPath = out.path();
    return {std::move(uploadPath), std::move(out)};
}
