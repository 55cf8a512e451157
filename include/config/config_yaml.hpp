#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ib::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<DeviceConfig> {
    static Node encode(const DeviceConfig& rhs) {
        Node node;
        node["address"] = rhs.address;
        node["model"] = rhs.model;
        node["detection_interval_seconds"] = rhs.detection_interval.count();
        node["listing_timeout_seconds"] = rhs.listing_timeout.count();
        node["probe_timeout_seconds"] = rhs.probe_timeout.count();
        node["upload_timeout_seconds"] = rhs.upload_timeout.count();
        node["max_crawl_depth"] = rhs.max_crawl_depth;
        return node;
    }

    static bool decode(const Node& node, DeviceConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.address = node["address"].as<std::string>("10.11.99.1");
        rhs.model = node["model"].as<std::string>("paper-pro");
        rhs.detection_interval = std::chrono::seconds(node["detection_interval_seconds"].as<unsigned int>(5));
        rhs.listing_timeout = std::chrono::seconds(node["listing_timeout_seconds"].as<unsigned int>(10));
        rhs.probe_timeout = std::chrono::seconds(node["probe_timeout_seconds"].as<unsigned int>(2));
        rhs.upload_timeout = std::chrono::seconds(node["upload_timeout_seconds"].as<unsigned int>(120));
        rhs.max_crawl_depth = node["max_crawl_depth"].as<unsigned int>(20);
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["preferred_format"] = rhs.preferred_format;
        node["target_folder"] = rhs.target_folder;
        node["inject_cover"] = rhs.inject_cover;
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.preferred_format = node["preferred_format"].as<std::string>("pdf");
        rhs.target_folder = node["target_folder"].as<std::string>("");
        rhs.inject_cover = node["inject_cover"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<ConversionConfig> {
    static Node encode(const ConversionConfig& rhs) {
        Node node;
        node["executable"] = rhs.executable;
        node["timeout_seconds"] = rhs.timeout.count();
        node["pdf_margin"] = rhs.pdf_margin;
        node["pdf_font_size"] = rhs.pdf_font_size;
        node["pdf_font"] = rhs.pdf_font;
        node["embed_all_fonts"] = rhs.embed_all_fonts;
        return node;
    }

    static bool decode(const Node& node, ConversionConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.executable = node["executable"].as<std::string>("");
        rhs.timeout = std::chrono::seconds(node["timeout_seconds"].as<unsigned int>(300));
        rhs.pdf_margin = node["pdf_margin"].as<unsigned int>(0);
        rhs.pdf_font_size = node["pdf_font_size"].as<unsigned int>(0);
        rhs.pdf_font = node["pdf_font"].as<std::string>("");
        rhs.embed_all_fonts = node["embed_all_fonts"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["inkbridge"] = to_std_string(spdlog::level::to_string_view(rhs.inkbridge));
        node["device"]    = to_std_string(spdlog::level::to_string_view(rhs.device));
        node["library"]   = to_std_string(spdlog::level::to_string_view(rhs.library));
        node["epub"]      = to_std_string(spdlog::level::to_string_view(rhs.epub));
        node["upload"]    = to_std_string(spdlog::level::to_string_view(rhs.upload));
        node["transfer"]  = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["convert"]   = to_std_string(spdlog::level::to_string_view(rhs.convert));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.inkbridge = spdlog::level::from_str(node["inkbridge"].as<std::string>("info"));
        rhs.device = spdlog::level::from_str(node["device"].as<std::string>("info"));
        rhs.library = spdlog::level::from_str(node["library"].as<std::string>("info"));
        rhs.epub = spdlog::level::from_str(node["epub"].as<std::string>("info"));
        rhs.upload = spdlog::level::from_str(node["upload"].as<std::string>("info"));
        rhs.transfer = spdlog::level::from_str(node["transfer"].as<std::string>("info"));
        rhs.convert = spdlog::level::from_str(node["convert"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

}
