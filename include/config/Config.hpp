#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace ib::config {

struct DeviceConfig {
    std::string address = "10.11.99.1";
    std::string model = "paper-pro";        // rm2 | paper-pro | pro-move
    std::chrono::seconds detection_interval{5};
    std::chrono::seconds listing_timeout{10};
    std::chrono::seconds probe_timeout{2};
    std::chrono::seconds upload_timeout{120};
    unsigned int max_crawl_depth = 20;
};

struct TransferConfig {
    std::string preferred_format = "pdf";   // epub | pdf
    std::string target_folder{};            // "" uploads to the device root
    bool inject_cover = true;
};

struct ConversionConfig {
    std::string executable{};               // "" resolves ebook-convert on PATH
    std::chrono::seconds timeout{300};
    unsigned int pdf_margin = 0;            // 0 = model preset
    unsigned int pdf_font_size = 0;         // 0 = model preset
    std::string pdf_font{};                 // "" = converter default serif
    bool embed_all_fonts = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum inkbridge = spdlog::level::info;
    spdlog::level::level_enum device    = spdlog::level::info;   // detection, crawling
    spdlog::level::level_enum library   = spdlog::level::info;   // booklist reconciliation
    spdlog::level::level_enum epub      = spdlog::level::info;   // repackaging, cover injection
    spdlog::level::level_enum upload    = spdlog::level::info;   // navigation and POST /upload
    spdlog::level::level_enum transfer  = spdlog::level::info;   // batch orchestration
    spdlog::level::level_enum convert   = spdlog::level::info;   // ebook-convert processes
};

struct LoggingConfig {
    std::filesystem::path log_dir{};        // "" = console only
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    DeviceConfig device;
    TransferConfig transfer;
    ConversionConfig conversion;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

// Throws std::invalid_argument when a setting is outside its accepted values.
void validate(const Config& cfg);

// Effective configuration as YAML, in the same layout loadConfig() reads.
std::string dumpConfig(const Config& cfg);

} // namespace ib::config
