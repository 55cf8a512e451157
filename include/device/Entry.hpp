#pragma once

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ib::device {

inline constexpr const char* COLLECTION_TYPE = "CollectionType";
inline constexpr const char* DOCUMENT_TYPE = "DocumentType";

// A single file or folder as reported by GET /documents/{id}.
struct Entry {
    std::string id{}, parent_id{}, name{};
    std::string type{DOCUMENT_TYPE};
    std::string file_type{};

    [[nodiscard]] bool isFolder() const { return type == COLLECTION_TYPE; }
};

void from_json(const nlohmann::json& j, Entry& entry);

}
