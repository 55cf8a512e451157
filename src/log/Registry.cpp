#include "log/Registry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <vector>

namespace ib::log {

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);
    sinks.push_back(console_sink_);

    // file sink only when a log directory is configured
    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        const fs::path logDir = cnf.log_dir;
        if (!fs::exists(logDir)) fs::create_directories(logDir);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logDir / "inkbridge.log").string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.subsystem_levels;
    makeLogger("inkbridge", sub_levels.inkbridge);
    makeLogger("device",    sub_levels.device);
    makeLogger("library",   sub_levels.library);
    makeLogger("epub",      sub_levels.epub);
    makeLogger("upload",    sub_levels.upload);
    makeLogger("transfer",  sub_levels.transfer);
    makeLogger("convert",   sub_levels.convert);

    initialized_ = true;
    inkbridge()->debug("[Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    if (auto logger = spdlog::get(name)) return logger;
    return spdlog::default_logger();
}

}
