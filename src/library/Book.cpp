#include "library/Book.hpp"

#include <algorithm>

using namespace ib::library;

namespace {

bool bothSetAndEqual(const std::optional<std::string>& a, const std::optional<std::string>& b) {
    return a && b && !a->empty() && !b->empty() && *a == *b;
}

bool isDisplayPath(const std::string& path) { return !path.empty() && path != "/"; }

}

std::string ib::library::to_string(const MatchTier tier) {
    switch (tier) {
        case MatchTier::DeviceId: return "device_id";
        case MatchTier::LibraryId: return "library_id";
        case MatchTier::Path: return "path";
    }
    return "unknown";
}

std::optional<MatchTier> ib::library::matchTier(const Book& a, const Book& b) {
    if (bothSetAndEqual(a.device_id, b.device_id)) return MatchTier::DeviceId;
    if (bothSetAndEqual(a.library_id, b.library_id)) return MatchTier::LibraryId;
    if (isDisplayPath(a.path) && isDisplayPath(b.path) && a.path == b.path) return MatchTier::Path;
    return std::nullopt;
}

bool ib::library::contains(const Booklist& list, const Book& book) {
    return std::ranges::any_of(list, [&](const Book& b) { return matchTier(b, book).has_value(); });
}
