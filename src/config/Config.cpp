#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

namespace dm::config {

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const char* key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error(fmt::format("Invalid configuration section '{}'", key));
}

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Configuration root must be a mapping");

    decodeSection(root, "cache", cfg.cache);
    decodeSection(root, "database", cfg.database);
    decodeSection(root, "gemini", cfg.gemini);
    decodeSection(root, "upload", cfg.upload);
    decodeSection(root, "sync", cfg.sync);
    decodeSection(root, "logging", cfg.logging);

    applyEnvOverrides(cfg);
    return cfg;
}

}

Config loadConfig(const std::string& path) {
    return fromRoot(YAML::LoadFile(path));
}

Config loadConfigFromString(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

void applyEnvOverrides(Config& cfg) {
    if (const char* mimes = std::getenv("GEMINI_UPLOAD_MIME_TYPES"); mimes && *mimes)
        cfg.upload.mime_types = mimes;
}

std::string DatabaseConfig::connectionString() const {
    std::string conn = fmt::format("host={} port={} dbname={} user={}", host, port, name, user);
    if (const char* pw = std::getenv(password_env.c_str()); pw && *pw) conn += fmt::format(" password={}", pw);
    return conn;
}

std::string GeminiConfig::apiKey() const {
    const char* key = std::getenv(api_key_env.c_str());
    if (!key || !*key) throw std::runtime_error(fmt::format("Environment variable {} is not set", api_key_env));
    return key;
}

std::string to_string(const NameTieBreak policy) {
    switch (policy) {
        case NameTieBreak::First: return "first";
        case NameTieBreak::Last: return "last";
    }
    return "first";
}

NameTieBreak parseNameTieBreak(const std::string& str) {
    if (str == "first") return NameTieBreak::First;
    if (str == "last") return NameTieBreak::Last;
    throw std::invalid_argument("Unknown name_tie_break policy: " + str);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"cache", c.cache},
        {"database", c.database},
        {"gemini", c.gemini},
        {"upload", c.upload},
        {"sync", c.sync},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const CacheConfig& c) {
    j = {{"dir", c.dir.string()}};
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"password_env", c.password_env},
        {"pool_size", c.pool_size}
    };
}

void to_json(nlohmann::json& j, const GeminiConfig& c) {
    j = {
        {"api_base", c.api_base},
        {"upload_base", c.upload_base},
        {"api_key_env", c.api_key_env},
        {"request_timeout_seconds", c.request_timeout_seconds},
        {"page_size", c.page_size}
    };
}

void to_json(nlohmann::json& j, const UploadConfig& c) {
    j = {
        {"batch_size", c.batch_size},
        {"poll_interval", durationToString(c.poll_interval)},
        {"max_poll_attempts", c.max_poll_attempts},
        {"poll_backoff", c.poll_backoff},
        {"max_poll_interval", durationToString(c.max_poll_interval)},
        {"stale_claim_after", durationToString(c.stale_claim_after)},
        {"idle_rescan", durationToString(c.idle_rescan)},
        {"mime_types", c.mime_types},
        {"omit_mime_extensions", c.omit_mime_extensions}
    };
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"sample_size", c.sample_size},
        {"name_tie_break", to_string(c.name_tie_break)}
    };
}

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"docmirror", levelName(c.docmirror)},
        {"db", levelName(c.db)},
        {"cloud", levelName(c.cloud)},
        {"storage", levelName(c.storage)},
        {"ingest", levelName(c.ingest)},
        {"worker", levelName(c.worker)},
        {"sync", levelName(c.sync)},
        {"stats", levelName(c.stats)},
        {"cli", levelName(c.cli)}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"log_levels", c.levels}
    };
}

} // namespace dm::config
