#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace ib::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name; falls back to spdlog's default logger when the name is not registered
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> inkbridge() { return get("inkbridge"); }
    static std::shared_ptr<spdlog::logger> device()    { return get("device"); }
    static std::shared_ptr<spdlog::logger> library()   { return get("library"); }
    static std::shared_ptr<spdlog::logger> epub()      { return get("epub"); }
    static std::shared_ptr<spdlog::logger> upload()    { return get("upload"); }
    static std::shared_ptr<spdlog::logger> transfer()  { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> convert()   { return get("convert"); }

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
