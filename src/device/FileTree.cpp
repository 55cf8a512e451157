#include "device/FileTree.hpp"

using namespace ib::device;

std::vector<std::pair<std::string, Entry>> FileTree::allFiles(const std::string& prefix) const {
    std::vector<std::pair<std::string, Entry>> result;
    for (const auto& node : entries) {
        if (node.entry.isFolder()) {
            auto sub = node.subtree.allFiles(prefix + node.entry.name + "/");
            result.insert(result.end(), std::make_move_iterator(sub.begin()), std::make_move_iterator(sub.end()));
        } else {
            result.emplace_back(prefix + node.entry.name, node.entry);
        }
    }
    return result;
}

std::vector<std::string> FileTree::allFileNames(const std::string& prefix) const {
    std::vector<std::string> names;
    for (auto& [path, entry] : allFiles(prefix)) names.push_back(std::move(path));
    return names;
}

std::vector<std::string> FileTree::allFileIds() const {
    std::vector<std::string> ids;
    for (const auto& [path, entry] : allFiles()) ids.push_back(entry.id);
    return ids;
}

std::vector<std::string> FileTree::allFolderPaths(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& node : entries) {
        if (!node.entry.isFolder()) continue;
        const auto path = prefix + node.entry.name;
        result.push_back(path);
        auto sub = node.subtree.allFolderPaths(path + "/");
        result.insert(result.end(), sub.begin(), sub.end());
    }
    return result;
}

std::vector<std::pair<std::string, std::string>> FileTree::folderIdMap(const std::string& prefix) const {
    std::vector<std::pair<std::string, std::string>> mapping;
    for (const auto& node : entries) {
        if (!node.entry.isFolder()) continue;
        const auto path = prefix + node.entry.name;
        mapping.emplace_back(path, node.entry.id);
        auto sub = node.subtree.folderIdMap(path + "/");
        mapping.insert(mapping.end(), sub.begin(), sub.end());
    }
    return mapping;
}

size_t FileTree::nodeCount() const {
    size_t n = entries.size();
    for (const auto& node : entries) n += node.subtree.nodeCount();
    return n;
}
