#pragma once

#include <functional>
#include <optional>
#include <string>

namespace ib::epub {

struct CoverPatch {
    std::string package_document;   // patched OPF bytes
    std::string page_path;          // archive path of the generated page, next to the OPF
    std::string page;
};

// Returns the entry's bytes, or nullopt when the archive has no such entry.
using EntryLookup = std::function<std::optional<std::string>(const std::string& archivePath)>;

/**
 * Adds a dedicated cover page at the front of the reading order when the
 * package document declares a cover image that its first page does not show.
 * The tablet renders the first spine page as the document thumbnail.
 */
class CoverInjector {
public:
    static constexpr const char* PAGE_FILENAME = "rm_cover.xhtml";
    static constexpr const char* PAGE_ID = "rm-cover-page";

    // nullopt when there is nothing to do. Throws std::runtime_error on an
    // unparseable package document.
    static std::optional<CoverPatch> inject(const std::string& packageDocument,
                                            const std::string& packagePath,
                                            const EntryLookup& readEntry);

    static std::string coverPage(const std::string& imageHref);
};

}
