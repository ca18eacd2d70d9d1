#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace dm::config {

constexpr auto DEFAULT_CONFIG_PATH = "/etc/docmirror/config.yaml";

class ConfigRegistry {
public:
    // Loads once. A missing file falls back to built-in defaults.
    static void init(const std::filesystem::path& path = defaultPath());
    static const Config& get();

    // DOCMIRROR_CONFIG when set, otherwise the packaged location
    static std::filesystem::path defaultPath();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace dm::config
