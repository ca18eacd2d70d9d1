#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace dm::config {

struct CacheConfig {
    std::filesystem::path dir = "/var/lib/docmirror/cache";
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "docmirror";
    std::string user = "docmirror";
    std::string password_env = "DOCMIRROR_DB_PASSWORD";
    int pool_size = 4;

    [[nodiscard]] std::string connectionString() const;
};

struct GeminiConfig {
    std::string api_base = "https://generativelanguage.googleapis.com/v1beta";
    std::string upload_base = "https://generativelanguage.googleapis.com/upload/v1beta";
    std::string api_key_env = "GEMINI_API_KEY";
    unsigned int request_timeout_seconds = 120;
    unsigned int page_size = 20;

    // Throws std::runtime_error when the credential variable is unset.
    [[nodiscard]] std::string apiKey() const;
};

constexpr auto DEFAULT_UPLOAD_MIME_TYPES = "mdx:text/markdown,l:text/markdown,ss:text/markdown,sc:text/markdown";

struct UploadConfig {
    unsigned int batch_size = 10;
    std::chrono::milliseconds poll_interval{5000};
    unsigned int max_poll_attempts = 120;
    double poll_backoff = 1.0;
    std::chrono::milliseconds max_poll_interval{60000};
    std::chrono::seconds stale_claim_after{30 * 60};
    std::chrono::seconds idle_rescan{60};
    std::string mime_types = DEFAULT_UPLOAD_MIME_TYPES;
    std::vector<std::string> omit_mime_extensions = {"json"};
};

enum class NameTieBreak { First, Last };

struct SyncConfig {
    unsigned int sample_size = 5;
    NameTieBreak name_tie_break = NameTieBreak::First;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum docmirror = spdlog::level::info;   // startup, shutdown, command dispatch
    spdlog::level::level_enum db        = spdlog::level::warn;   // failed transactions, pool exhaustion
    spdlog::level::level_enum cloud     = spdlog::level::info;   // remote calls and HTTP failures
    spdlog::level::level_enum storage   = spdlog::level::warn;   // cache I/O
    spdlog::level::level_enum ingest    = spdlog::level::info;
    spdlog::level::level_enum worker    = spdlog::level::info;   // batch lifecycle, per-document failures
    spdlog::level::level_enum sync      = spdlog::level::info;
    spdlog::level::level_enum stats     = spdlog::level::warn;
    spdlog::level::level_enum cli       = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/docmirror";
    LogLevelsConfig levels;
};

struct Config {
    CacheConfig cache;
    DatabaseConfig database;
    GeminiConfig gemini;
    UploadConfig upload;
    SyncConfig sync;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);
Config loadConfigFromString(const std::string& yaml);

// Environment variables win over file values.
void applyEnvOverrides(Config& cfg);

std::string to_string(NameTieBreak policy);
NameTieBreak parseNameTieBreak(const std::string& str);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const CacheConfig& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void to_json(nlohmann::json& j, const GeminiConfig& c);
void to_json(nlohmann::json& j, const UploadConfig& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace dm::config
