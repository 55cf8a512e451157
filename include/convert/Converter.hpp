#pragma once

#include "device/Model.hpp"
#include "util/TempFile.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace ib::config { struct Config; }

namespace ib::convert {

using ConvertProgressFn = std::function<void(double fraction)>;

struct ConversionOptions {
    device::Model model{device::Model::PaperPro};
    unsigned int margin{0};         // 0 keeps the model preset
    unsigned int font_size{0};      // 0 keeps the model preset
    std::string font{};             // serif family override
    bool embed_all_fonts{true};
    std::chrono::seconds timeout{300};

    static ConversionOptions fromConfig(const config::Config& cfg);
};

/**
 * Turns a reflowable document into a PDF laid out for the tablet.
 *
 * Implementations are called concurrently from conversion workers. Setting
 * `cancel` must abort a running conversion promptly; the call then throws
 * ConversionError.
 */
class Converter {
public:
    virtual ~Converter() = default;

    virtual util::TempFile toPdf(const std::filesystem::path& source,
                                 const ConvertProgressFn& onProgress,
                                 const std::atomic<bool>& cancel) = 0;
};

}
