#include "epub/CoverInjector.hpp"
#include "log/Registry.hpp"

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <fmt/format.h>
#include <pugixml.hpp>

using namespace ib::epub;
using namespace ib::log;

namespace {

std::string_view localName(const pugi::xml_node& node) {
    const std::string_view name = node.name();
    const auto colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

std::string prefixOf(const pugi::xml_node& node) {
    const std::string_view name = node.name();
    const auto colon = name.find(':');
    return colon == std::string_view::npos ? "" : std::string(name.substr(0, colon + 1));
}

// New elements take the same namespace prefix as their parent.
std::string qualified(const pugi::xml_node& parent, const char* local) {
    return prefixOf(parent) + local;
}

pugi::xml_node childByLocalName(const pugi::xml_node& parent, const std::string_view local) {
    for (auto child : parent.children())
        if (child.type() == pugi::node_element && localName(child) == local) return child;
    return {};
}

pugi::xml_node findDescendant(const pugi::xml_node& root, const std::string_view local,
                              const char* attr, const std::string_view value) {
    return root.find_node([&](const pugi::xml_node& n) {
        return n.type() == pugi::node_element && localName(n) == local && value == n.attribute(attr).value();
    });
}

std::string dirOf(const std::string& archivePath) {
    const auto slash = archivePath.rfind('/');
    return slash == std::string::npos ? "" : archivePath.substr(0, slash + 1);
}

std::string resolve(const std::string& baseDir, const std::string& href) {
    return std::filesystem::path(baseDir + href).lexically_normal().generic_string();
}

std::string fileName(const std::string& href) {
    const auto slash = href.rfind('/');
    return slash == std::string::npos ? href : href.substr(slash + 1);
}

std::string escapeAttr(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (const char c : in) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

}

std::string CoverInjector::coverPage(const std::string& imageHref) {
    return fmt::format(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<html xmlns=\"http://www.w3.org/1999/xhtml\">\n"
        "<head><title>Cover</title></head>\n"
        "<body style=\"margin:0;padding:0;\">\n"
        "<div style=\"text-align:center;\">\n"
        "<img src=\"{}\" style=\"max-width:100%;max-height:100%;\" alt=\"Cover\"/>\n"
        "</div>\n"
        "</body>\n"
        "</html>\n", escapeAttr(imageHref));
}

std::optional<CoverPatch> CoverInjector::inject(const std::string& packageDocument,
                                                const std::string& packagePath,
                                                const EntryLookup& readEntry) {
    pugi::xml_document doc;
    const auto parsed = doc.load_buffer(packageDocument.data(), packageDocument.size(),
                                        pugi::parse_default | pugi::parse_declaration | pugi::parse_comments);
    if (!parsed)
        throw std::runtime_error(fmt::format("Malformed package document {}: {} at offset {}",
                                             packagePath, parsed.description(), parsed.offset));

    const auto package = doc.document_element();
    const auto meta = findDescendant(package, "meta", "name", "cover");
    const std::string coverId = meta.attribute("content").value();
    if (coverId.empty()) return std::nullopt;

    auto manifest = childByLocalName(package, "manifest");
    if (!manifest) return std::nullopt;

    const auto image = findDescendant(manifest, "item", "id", coverId);
    const std::string mediaType = image.attribute("media-type").value();
    const std::string coverHref = image.attribute("href").value();
    if (!image || !mediaType.starts_with("image/") || coverHref.empty()) return std::nullopt;

    auto spine = childByLocalName(package, "spine");
    const auto firstRef = spine ? childByLocalName(spine, "itemref") : pugi::xml_node{};
    if (!firstRef) return std::nullopt;

    const std::string firstId = firstRef.attribute("idref").value();
    if (firstId == PAGE_ID) return std::nullopt;

    const auto baseDir = dirOf(packagePath);
    if (const auto firstItem = findDescendant(manifest, "item", "id", firstId)) {
        const auto pagePath = resolve(baseDir, firstItem.attribute("href").value());
        if (const auto text = readEntry(pagePath)) {
            if (text->find(coverHref) != std::string::npos || text->find(fileName(coverHref)) != std::string::npos) {
                Registry::epub()->debug("[CoverInjector] First page {} already shows the cover", pagePath);
                return std::nullopt;
            }
        }
    }

    if (!findDescendant(manifest, "item", "id", PAGE_ID)) {
        auto item = manifest.append_child(qualified(manifest, "item").c_str());
        item.append_attribute("id") = PAGE_ID;
        item.append_attribute("href") = PAGE_FILENAME;
        item.append_attribute("media-type") = "application/xhtml+xml";
    }

    auto itemref = spine.insert_child_before(qualified(spine, "itemref").c_str(), firstRef);
    itemref.append_attribute("idref") = PAGE_ID;

    auto guide = childByLocalName(package, "guide");
    if (!guide) guide = package.insert_child_after(qualified(package, "guide").c_str(), spine);

    if (auto existing = findDescendant(guide, "reference", "type", "cover")) {
        auto href = existing.attribute("href");
        if (!href) href = existing.append_attribute("href");
        href = PAGE_FILENAME;
    } else {
        auto ref = guide.append_child(qualified(guide, "reference").c_str());
        ref.append_attribute("type") = "cover";
        ref.append_attribute("title") = "Cover";
        ref.append_attribute("href") = PAGE_FILENAME;
    }

    std::ostringstream out;
    doc.save(out, "", pugi::format_raw, pugi::encoding_utf8);

    Registry::epub()->debug("[CoverInjector] Injected cover page for image {} into {}", coverHref, packagePath);
    return CoverPatch{out.str(), baseDir + PAGE_FILENAME, coverPage(coverHref)};
}
