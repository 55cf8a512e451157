#pragma once

#include "library/Book.hpp"
#include "device/FileTree.hpp"

#include <string>
#include <vector>

namespace ib::library {

// Host-side metadata for a book that was just sent to the device.
struct BookMetadata {
    std::optional<std::string> library_id{};
    std::string title{};
    std::vector<std::string> authors{};
    std::string author_sort{};
    uint64_t size{0};
    std::optional<std::chrono::system_clock::time_point> timestamp{};
    std::vector<std::string> tags{};
};

struct MergeResult {
    Booklist local, remote;
};

class Reconciler {
public:
    /**
     * Non-destructive union of the host's booklist and a fresh device scan.
     * Local books missing remotely are appended to the remote side, then every
     * remote book missing locally is appended to the local side. Nothing is
     * ever removed, so a book deleted on the tablet stays listed locally.
     */
    static MergeResult merge(Booklist local, Booklist remote);

    // One Book per document in the tree; title falls back to the path.
    static Booklist booksFromTree(const device::FileTree& tree);

    static void addToBooklist(const std::vector<std::string>& locations,
                              const std::vector<BookMetadata>& metadata,
                              Booklist& booklist);

    static void removeFromBooklist(const std::vector<std::string>& paths, Booklist& booklist);
};

}
