#include "device/Crawler.hpp"
#include "device/Api.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <unordered_set>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace ib::device;
using namespace ib::log;

std::string ib::device::to_string(const FolderLookup::Status status) {
    switch (status) {
        case FolderLookup::Status::NotRequested: return "not requested";
        case FolderLookup::Status::Found: return "found";
        case FolderLookup::Status::NotFound: return "not found";
        case FolderLookup::Status::LookupFailed: return "lookup failed";
    }
    return "unknown";
}

double ib::device::scanFraction(const size_t entriesSeen) {
    return 0.1 + std::min(static_cast<double>(entriesSeen) / 100.0, 1.0) * 0.6;
}

Crawler::Crawler(std::shared_ptr<http::Client> client, std::string address,
                 const std::chrono::milliseconds listingTimeout, const unsigned int maxDepth)
    : client_(std::move(client)), address_(std::move(address)),
      listingTimeout_(listingTimeout), maxDepth_(maxDepth) {
    if (!client_) throw std::invalid_argument("Crawler requires an HTTP client");
}

std::vector<Entry> Crawler::fetchListing(const std::string& folderId) const {
    const auto req = api::listingRequest(address_, folderId, listingTimeout_);
    const auto context = fmt::format("Listing folder '{}' on {}", folderId, address_);

    const auto res = client_->get(req);
    if (res.transportFailed()) {
        Registry::device()->warn("[Crawler] {} failed: {}", context, res.error);
        api::throwTransportFailure(res, context);
    }

    if (!res.ok())
        throw ProtocolError(res.http, fmt::format("{}: HTTP {}: {}", context, res.http,
                                                  api::truncateBody(res.body)));

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(res.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProtocolError(res.http, fmt::format("{}: malformed JSON ({}): {}", context, e.what(),
                                                  api::truncateBody(res.body)));
    }

    if (!doc.is_array())
        throw ProtocolError(res.http, fmt::format("{}: expected a JSON array, got {}", context, doc.type_name()));

    std::vector<Entry> entries;
    entries.reserve(doc.size());
    std::unordered_set<std::string> seenIds;

    for (const auto& item : doc) {
        Entry entry;
        try {
            entry = item.get<Entry>();
        } catch (const nlohmann::json::exception& e) {
            throw ProtocolError(res.http, fmt::format("{}: malformed entry ({})", context, e.what()));
        }

        if (!seenIds.insert(entry.id).second) {
            Registry::device()->warn("[Crawler] Duplicate entry id '{}' in folder '{}', dropping '{}'",
                                     entry.id, folderId, entry.name);
            continue;
        }
        entries.push_back(std::move(entry));
    }

    std::ranges::stable_sort(entries, {}, &Entry::parent_id);
    return entries;
}

FileTree Crawler::buildTree(const std::string& folderId, const ScanProgressFn& onProgress) const {
    return buildTree(folderId, maxDepth_, onProgress);
}

FileTree Crawler::buildTree(const std::string& folderId, const unsigned int maxDepth,
                            const ScanProgressFn& onProgress) const {
    size_t seen = 0;
    return crawl(folderId, 0, maxDepth, onProgress, seen);
}

FileTree Crawler::crawl(const std::string& folderId, const unsigned int depth, const unsigned int maxDepth,
                        const ScanProgressFn& onProgress, size_t& seen) const {
    if (depth >= maxDepth) {
        Registry::device()->warn("[Crawler] Max depth {} reached at folder '{}', not descending further",
                                 maxDepth, folderId);
        return {};
    }

    auto listing = fetchListing(folderId);
    seen += listing.size();
    if (onProgress) onProgress(seen);

    FileTree tree;
    tree.entries.reserve(listing.size());
    for (auto& entry : listing) {
        FileTreeNode node{std::move(entry), {}};
        if (node.entry.isFolder())
            node.subtree = crawl(node.entry.id, depth + 1, maxDepth, onProgress, seen);
        tree.entries.push_back(std::move(node));
    }
    return tree;
}

FolderLookup Crawler::lookupFolder(const std::string& name) const {
    if (name.empty()) return {};

    std::vector<std::pair<std::string, std::string>> folders;
    try {
        folders = buildTree("", FOLDER_LOOKUP_DEPTH).folderIdMap();
    } catch (const std::exception& e) {
        Registry::device()->warn("[Crawler] Folder lookup for '{}' failed: {}", name, e.what());
        return {FolderLookup::Status::LookupFailed, ""};
    }

    for (const auto& [path, id] : folders)
        if (path == name) return {FolderLookup::Status::Found, id};

    const auto wanted = util::toLower(name);
    for (const auto& [path, id] : folders)
        if (util::toLower(path) == wanted) return {FolderLookup::Status::Found, id};

    return {FolderLookup::Status::NotFound, ""};
}

std::string Crawler::findFolderId(const std::string& name) const {
    return lookupFolder(name).id;
}

bool Crawler::isReachable(http::Client& client, const std::string& address,
                          const std::chrono::milliseconds timeout) {
    try {
        const auto res = client.get(api::listingRequest(address, "", timeout));
        if (res.ok()) return true;
        if (res.transportFailed())
            Registry::device()->debug("[Crawler] {} unreachable: {}", address, res.error);
        else
            Registry::device()->debug("[Crawler] {} answered HTTP {} to probe", address, res.http);
    } catch (const std::exception& e) {
        Registry::device()->debug("[Crawler] Probe of {} failed: {}", address, e.what());
    }
    return false;
}
