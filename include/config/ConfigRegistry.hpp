#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace ib::config {

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path);
    static void init(const Config& config);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace ib::config
