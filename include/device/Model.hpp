#pragma once

#include <string>
#include <string_view>

namespace ib::device {

enum class Model { RM2, PaperPro, ProMove };

// Page geometry the converter targets for a given tablet.
struct ModelPreset {
    std::string_view name;
    double width_in, height_in;
    unsigned int margin, font_size;
};

const ModelPreset& presetFor(Model model);

// Unknown names fall back to Model::PaperPro
Model parseModel(const std::string& name);

}
