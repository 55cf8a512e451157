#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <fmt/core.h>
#include <stdexcept>

namespace ib::config {

void validate(const Config& cfg) {
    if (cfg.transfer.preferred_format != "pdf" && cfg.transfer.preferred_format != "epub")
        throw std::invalid_argument(fmt::format("Invalid preferred_format '{}' (expected epub or pdf)",
                                                cfg.transfer.preferred_format));
}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error(fmt::format("Config file not found: {}", path.string()));

    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["device"]) YAML::convert<DeviceConfig>::decode(node, cfg.device);
    if (auto node = root["transfer"]) YAML::convert<TransferConfig>::decode(node, cfg.transfer);
    if (auto node = root["conversion"]) YAML::convert<ConversionConfig>::decode(node, cfg.conversion);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    validate(cfg);
    return cfg;
}

std::string dumpConfig(const Config& cfg) {
    YAML::Node root;
    root["device"] = cfg.device;
    root["transfer"] = cfg.transfer;
    root["conversion"] = cfg.conversion;
    root["logging"] = cfg.logging;

    YAML::Emitter out;
    out << root;
    return out.c_str();
}

} // namespace ib::config
