#pragma once

#include "device/FileTree.hpp"
#include "http/Client.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ib::device {

using ScanProgressFn = std::function<void(size_t entriesSeen)>;

struct FolderLookup {
    enum class Status { NotRequested, Found, NotFound, LookupFailed };

    Status status{Status::NotRequested};
    std::string id{};  // "" is the root

    [[nodiscard]] bool found() const { return status == Status::Found; }
};

std::string to_string(FolderLookup::Status status);

// Cosmetic scan progress in [0.1, 0.7] for a running entry count.
double scanFraction(size_t entriesSeen);

/**
 * Walks the tablet's document tree over GET /documents/{id}.
 *
 * Every listing request also moves the device's "current directory", so the
 * crawler must not run concurrently with an upload against the same device.
 */
class Crawler {
public:
    static constexpr unsigned int DEFAULT_MAX_DEPTH = 20;
    static constexpr unsigned int FOLDER_LOOKUP_DEPTH = 3;

    Crawler(std::shared_ptr<http::Client> client, std::string address,
            std::chrono::milliseconds listingTimeout = std::chrono::seconds(10),
            unsigned int maxDepth = DEFAULT_MAX_DEPTH);

    [[nodiscard]] std::vector<Entry> fetchListing(const std::string& folderId = "") const;

    [[nodiscard]] FileTree buildTree(const std::string& folderId = "",
                                     const ScanProgressFn& onProgress = {}) const;
    [[nodiscard]] FileTree buildTree(const std::string& folderId, unsigned int maxDepth,
                                     const ScanProgressFn& onProgress = {}) const;

    // Never throws; failures are reported through the status.
    [[nodiscard]] FolderLookup lookupFolder(const std::string& name) const;
    [[nodiscard]] std::string findFolderId(const std::string& name) const;

    static bool isReachable(http::Client& client, const std::string& address,
                            std::chrono::milliseconds timeout = std::chrono::seconds(2));

    [[nodiscard]] const std::string& address() const { return address_; }

private:
    std::shared_ptr<http::Client> client_;
    std::string address_;
    std::chrono::milliseconds listingTimeout_;
    unsigned int maxDepth_;

    FileTree crawl(const std::string& folderId, unsigned int depth, unsigned int maxDepth,
                   const ScanProgressFn& onProgress, size_t& seen) const;
};

}
