#pragma once

#include "convert/Converter.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace ib::convert {

// Converter backed by Calibre's `ebook-convert` command line tool.
class EbookConvert final : public Converter {
public:
    static constexpr size_t DIAGNOSTIC_TAIL = 500;

    explicit EbookConvert(ConversionOptions opts, std::filesystem::path executable = {});

    util::TempFile toPdf(const std::filesystem::path& source,
                         const ConvertProgressFn& onProgress,
                         const std::atomic<bool>& cancel) override;

    [[nodiscard]] std::vector<std::string> buildArgs(const std::filesystem::path& source,
                                                     const std::filesystem::path& output) const;

    // Configured path if set, else `ebook-convert` on PATH or in a Calibre install dir.
    static std::filesystem::path locateExecutable(const std::filesystem::path& configured = {});

private:
    ConversionOptions opts_;
    std::filesystem::path executable_;
    std::once_flag resolved_;
};

}
