#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ib::library {

/**
 * Identity and display record for a book, either tracked by the host library
 * or found on the tablet.
 *
 * Books scanned from the device carry a device id and a path but no library
 * id; books added by the host carry a library id but no device id. Equality
 * is therefore partial, see matchTier().
 */
struct Book {
    std::optional<std::string> device_id{}, library_id{};
    std::string path{"/"};
    std::string title{};
    std::vector<std::string> authors{};
    std::string author_sort{};
    uint64_t size{0};
    std::optional<std::chrono::system_clock::time_point> timestamp{};
    std::vector<std::string> tags{};
};

using Booklist = std::vector<Book>;

enum class MatchTier { DeviceId, LibraryId, Path };

std::string to_string(MatchTier tier);

/**
 * First identity tier on which both books agree, evaluated in order:
 * device id, library id, display path. A tier only applies when both sides
 * carry a non-empty value; the root path "/" never matches.
 *
 * Not transitive: A(device x) matches B(device x, library y), B matches
 * C(library y), while A and C share nothing. The same file held under
 * divergent identifiers can therefore appear twice after a merge.
 */
std::optional<MatchTier> matchTier(const Book& a, const Book& b);

inline bool operator==(const Book& a, const Book& b) { return matchTier(a, b).has_value(); }

bool contains(const Booklist& list, const Book& book);

}
