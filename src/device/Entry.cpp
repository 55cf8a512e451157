#include "device/Entry.hpp"

#include <nlohmann/json.hpp>

using namespace ib::device;

namespace {

std::string stringField(const nlohmann::json& j, const char* key, const std::string& def = "") {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

}

void ib::device::from_json(const nlohmann::json& j, Entry& entry) {
    entry.id = j.at("ID").get<std::string>();
    entry.parent_id = stringField(j, "Parent");
    // "VissibleName" is the field name the device publishes, misspelling included
    entry.name = stringField(j, "VissibleName");
    entry.type = stringField(j, "Type", DOCUMENT_TYPE);
    entry.file_type = stringField(j, "fileType");
}
