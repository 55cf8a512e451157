#pragma once

#include "device/Entry.hpp"

#include <string>
#include <utility>
#include <vector>

namespace ib::device {

struct FileTreeNode;

// Ordered listing of one folder level. Each folder node exclusively owns its subtree.
struct FileTree {
    std::vector<FileTreeNode> entries;

    // (path, entry) for every document, recursively
    [[nodiscard]] std::vector<std::pair<std::string, Entry>> allFiles(const std::string& prefix = "") const;
    [[nodiscard]] std::vector<std::string> allFileNames(const std::string& prefix = "") const;
    [[nodiscard]] std::vector<std::string> allFileIds() const;
    [[nodiscard]] std::vector<std::string> allFolderPaths(const std::string& prefix = "") const;

    // (folder path, folder id) in crawl order
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> folderIdMap(const std::string& prefix = "") const;

    [[nodiscard]] size_t nodeCount() const;
    [[nodiscard]] bool empty() const { return entries.empty(); }
};

struct FileTreeNode {
    Entry entry;
    FileTree subtree{};
};

}
