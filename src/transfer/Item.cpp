#include "transfer/Item.hpp"
#include "util/files.hpp"

#include <stdexcept>
#include <fmt/format.h>

using namespace ib::transfer;

void Item::adoptConverted(util::TempFile pdf) {
    converted = std::move(pdf);
    upload_name = std::filesystem::path(upload_name).replace_extension(".pdf").string();
}

std::vector<Item> ib::transfer::buildItems(const std::vector<std::filesystem::path>& files,
                                           const std::vector<std::string>& names,
                                           const std::string& preferredFormat) {
    if (files.size() != names.size())
        throw std::invalid_argument(fmt::format("{} files but {} names", files.size(), names.size()));

    std::vector<Item> items;
    items.reserve(files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        Item item;
        item.index = i;
        item.source = files[i];
        item.visible_name = names[i];
        item.upload_name = std::filesystem::path(names[i]).filename().string();
        if (item.upload_name.empty()) item.upload_name = files[i].filename().string();
        item.needs_conversion = preferredFormat == "pdf" && util::lowerExtension(files[i]) == ".epub";
        items.push_back(std::move(item));
    }
    return items;
}
