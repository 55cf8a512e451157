#include "library/Reconciler.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>

using namespace ib::library;
using namespace ib::log;

MergeResult Reconciler::merge(Booklist local, Booklist remote) {
    size_t pushedRemote = 0, pushedLocal = 0;

    for (const auto& book : local) {
        if (contains(remote, book)) continue;
        remote.push_back(book);
        ++pushedRemote;
    }

    for (const auto& book : remote) {
        if (contains(local, book)) continue;
        local.push_back(book);
        ++pushedLocal;
    }

    Registry::library()->debug("[Reconciler] Merged booklists: {} local-only, {} new from device, {} total",
                               pushedRemote, pushedLocal, local.size());
    return {std::move(local), std::move(remote)};
}

Booklist Reconciler::booksFromTree(const device::FileTree& tree) {
    Booklist books;
    for (const auto& [path, entry] : tree.allFiles()) {
        Book book;
        book.device_id = entry.id;
        book.path = path;
        book.title = entry.name.empty() ? path : entry.name;
        books.push_back(std::move(book));
    }
    return books;
}

void Reconciler::addToBooklist(const std::vector<std::string>& locations,
                               const std::vector<BookMetadata>& metadata,
                               Booklist& booklist) {
    if (locations.size() < metadata.size())
        throw std::invalid_argument(fmt::format("addToBooklist: {} metadata records but only {} locations",
                                                metadata.size(), locations.size()));

    for (size_t i = 0; i < metadata.size(); ++i) {
        const auto& meta = metadata[i];
        Book book{
            .device_id = std::nullopt,
            .library_id = meta.library_id,
            .path = locations[i],
            .title = meta.title,
            .authors = meta.authors,
            .author_sort = meta.author_sort,
            .size = meta.size,
            .timestamp = meta.timestamp,
            .tags = meta.tags
        };
        if (contains(booklist, book)) continue;
        booklist.push_back(std::move(book));
    }
}

void Reconciler::removeFromBooklist(const std::vector<std::string>& paths, Booklist& booklist) {
    const auto removed = std::erase_if(booklist, [&](const Book& b) {
        return std::ranges::find(paths, b.path) != paths.end();
    });
    Registry::library()->debug("[Reconciler] Removed {} books from booklist", removed);
}
