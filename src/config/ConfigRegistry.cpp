#include "config/ConfigRegistry.hpp"

#include <cstdlib>
#include <stdexcept>

namespace dm::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        if (std::filesystem::exists(path)) config_ = loadConfig(path.string());
        else {
            config_ = Config{};
            applyEnvOverrides(config_);
        }
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

std::filesystem::path ConfigRegistry::defaultPath() {
    if (const char* env = std::getenv("DOCMIRROR_CONFIG"); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace dm::config
