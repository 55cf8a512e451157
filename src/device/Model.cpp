#include "device/Model.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <array>

using namespace ib::device;

namespace {

constexpr std::array<ModelPreset, 3> PRESETS{{
    {"rm2", 6.2, 8.3, 36, 18},
    {"paper-pro", 7.1, 9.4, 36, 20},
    {"pro-move", 3.6, 6.4, 18, 14},
}};

}

const ModelPreset& ib::device::presetFor(const Model model) {
    switch (model) {
        case Model::RM2: return PRESETS[0];
        case Model::ProMove: return PRESETS[2];
        case Model::PaperPro:
        default: return PRESETS[1];
    }
}

Model ib::device::parseModel(const std::string& name) {
    const auto lowered = util::toLower(name);
    if (lowered == "rm2") return Model::RM2;
    if (lowered == "pro-move") return Model::ProMove;
    if (lowered != "paper-pro")
        log::Registry::device()->warn("[Model] Unknown device model '{}', using paper-pro", name);
    return Model::PaperPro;
}
