#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace dm::config { struct LoggingConfig; }

namespace dm::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels. Safe to call more than once.
    static void init(const std::filesystem::path& logDir, const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> docmirror() { return get("docmirror"); }
    static std::shared_ptr<spdlog::logger> db()        { return get("db"); }
    static std::shared_ptr<spdlog::logger> cloud()     { return get("cloud"); }
    static std::shared_ptr<spdlog::logger> storage()   { return get("storage"); }
    static std::shared_ptr<spdlog::logger> ingest()    { return get("ingest"); }
    static std::shared_ptr<spdlog::logger> worker()    { return get("worker"); }
    static std::shared_ptr<spdlog::logger> sync()      { return get("sync"); }
    static std::shared_ptr<spdlog::logger> stats()     { return get("stats"); }
    static std::shared_ptr<spdlog::logger> cli()       { return get("cli"); }

    [[nodiscard]] static bool isInitialized();

    static void reopenMainLog();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void replaceSinkEverywhere_(const std::shared_ptr<spdlog::sinks::sink>& old_sink,
                                       const std::shared_ptr<spdlog::sinks::sink>& new_sink);
};

}
