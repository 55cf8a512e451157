#pragma once

#include "util/TempFile.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ib::transfer {

struct Item {
    size_t index{0};
    std::filesystem::path source;
    std::string visible_name;           // name the host knows the book by
    std::string upload_name;            // basename shown on the tablet
    bool needs_conversion{false};
    util::TempFile converted{};         // PDF produced by the conversion phase, if any

    [[nodiscard]] const std::filesystem::path& uploadPath() const {
        return converted ? converted.path() : source;
    }

    // Takes ownership of a converted PDF and renames the upload to match.
    void adoptConverted(util::TempFile pdf);
};

// Conversion is needed when PDF is preferred and the source is an EPUB.
std::vector<Item> buildItems(const std::vector<std::filesystem::path>& files,
                             const std::vector<std::string>& names,
                             const std::string& preferredFormat);

}
