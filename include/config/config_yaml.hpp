#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace dm::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template <typename Duration>
static Duration durationOr(const Node& node, const Duration def) {
    if (!node) return def;
    return std::chrono::duration_cast<Duration>(parseDuration(node.as<std::string>()));
}

template<>
struct convert<CacheConfig> {
    static Node encode(const CacheConfig& rhs) {
        Node node;
        node["dir"] = rhs.dir.string();
        return node;
    }

    static bool decode(const Node& node, CacheConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.dir = node["dir"].as<std::string>(rhs.dir.string());
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password_env"] = rhs.password_env;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("docmirror");
        rhs.user = node["user"].as<std::string>("docmirror");
        rhs.password_env = node["password_env"].as<std::string>("DOCMIRROR_DB_PASSWORD");
        rhs.pool_size = node["pool_size"].as<int>(4);
        return true;
    }
};

template<>
struct convert<GeminiConfig> {
    static Node encode(const GeminiConfig& rhs) {
        Node node;
        node["api_base"] = rhs.api_base;
        node["upload_base"] = rhs.upload_base;
        node["api_key_env"] = rhs.api_key_env;
        node["request_timeout_seconds"] = rhs.request_timeout_seconds;
        node["page_size"] = rhs.page_size;
        return node;
    }

    static bool decode(const Node& node, GeminiConfig& rhs) {
        if (!node.IsMap()) return false;
        const GeminiConfig def;
        rhs.api_base = node["api_base"].as<std::string>(def.api_base);
        rhs.upload_base = node["upload_base"].as<std::string>(def.upload_base);
        rhs.api_key_env = node["api_key_env"].as<std::string>(def.api_key_env);
        rhs.request_timeout_seconds = node["request_timeout_seconds"].as<unsigned int>(def.request_timeout_seconds);
        rhs.page_size = node["page_size"].as<unsigned int>(def.page_size);
        return true;
    }
};

template<>
struct convert<UploadConfig> {
    static Node encode(const UploadConfig& rhs) {
        Node node;
        node["batch_size"] = rhs.batch_size;
        node["poll_interval"] = durationToString(rhs.poll_interval);
        node["max_poll_attempts"] = rhs.max_poll_attempts;
        node["poll_backoff"] = rhs.poll_backoff;
        node["max_poll_interval"] = durationToString(rhs.max_poll_interval);
        node["stale_claim_after"] = durationToString(rhs.stale_claim_after);
        node["idle_rescan"] = durationToString(rhs.idle_rescan);
        node["mime_types"] = rhs.mime_types;
        node["omit_mime_extensions"] = rhs.omit_mime_extensions;
        return node;
    }

    static bool decode(const Node& node, UploadConfig& rhs) {
        if (!node.IsMap()) return false;
        const UploadConfig def;
        rhs.batch_size = node["batch_size"].as<unsigned int>(def.batch_size);
        rhs.poll_interval = durationOr(node["poll_interval"], def.poll_interval);
        rhs.max_poll_attempts = node["max_poll_attempts"].as<unsigned int>(def.max_poll_attempts);
        rhs.poll_backoff = node["poll_backoff"].as<double>(def.poll_backoff);
        rhs.max_poll_interval = durationOr(node["max_poll_interval"], def.max_poll_interval);
        rhs.stale_claim_after = durationOr(node["stale_claim_after"], def.stale_claim_after);
        rhs.idle_rescan = durationOr(node["idle_rescan"], def.idle_rescan);
        rhs.mime_types = node["mime_types"].as<std::string>(def.mime_types);
        if (node["omit_mime_extensions"]) rhs.omit_mime_extensions = node["omit_mime_extensions"].as<std::vector<std::string>>();
        if (rhs.batch_size == 0) return false;
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["sample_size"] = rhs.sample_size;
        node["name_tie_break"] = to_string(rhs.name_tie_break);
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.sample_size = node["sample_size"].as<unsigned int>(5);
        rhs.name_tie_break = parseNameTieBreak(node["name_tie_break"].as<std::string>("first"));
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["docmirror"] = to_std_string(spdlog::level::to_string_view(rhs.docmirror));
        node["db"]        = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["cloud"]     = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["storage"]   = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["ingest"]    = to_std_string(spdlog::level::to_string_view(rhs.ingest));
        node["worker"]    = to_std_string(spdlog::level::to_string_view(rhs.worker));
        node["sync"]      = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["stats"]     = to_std_string(spdlog::level::to_string_view(rhs.stats));
        node["cli"]       = to_std_string(spdlog::level::to_string_view(rhs.cli));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.docmirror = levelOr(node["docmirror"], rhs.docmirror);
        rhs.db = levelOr(node["db"], rhs.db);
        rhs.cloud = levelOr(node["cloud"], rhs.cloud);
        rhs.storage = levelOr(node["storage"], rhs.storage);
        rhs.ingest = levelOr(node["ingest"], rhs.ingest);
        rhs.worker = levelOr(node["worker"], rhs.worker);
        rhs.sync = levelOr(node["sync"], rhs.sync);
        rhs.stats = levelOr(node["stats"], rhs.stats);
        rhs.cli = levelOr(node["cli"], rhs.cli);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node["console_log_level"], spdlog::level::info);
        rhs.file_log_level = levelOr(node["file_log_level"], spdlog::level::debug);
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(rhs.log_dir.string());
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
