#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace dm::cli {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;
    std::string stderr_text;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string usage;
    std::string description;
    CommandHandler handler;
};

namespace exit_code {
constexpr int OK = 0;
constexpr int FAILURE = 1;
constexpr int USAGE = 2;
constexpr int NOT_FOUND = 3;
constexpr int CONFLICT = 4;
}

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);
CommandResult okJson(const nlohmann::json& data);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);

// Strict unsigned parse; nullopt on anything but digits
std::optional<unsigned int> parseUInt(const std::string& s);

}
