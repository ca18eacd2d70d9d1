#pragma once

#include "cli/types.hpp"

#include <map>
#include <string>
#include <unordered_set>
#include <vector>

namespace dm::cli {

class Router {
public:
    void registerCommand(const std::string& name, std::string usage, std::string description, CommandHandler handler);

    // Options that never take a value
    void registerSwitch(const std::string& key) { switches_.insert(key); }

    // Runs the command named by args[0]. Errors raised by handlers are mapped to exit codes.
    CommandResult execute(const std::vector<std::string>& args) const;

    [[nodiscard]] CommandCall parse(const std::vector<std::string>& args) const;

    [[nodiscard]] std::string help() const;

    [[nodiscard]] bool contains(const std::string& name) const { return commands_.contains(name); }

private:
    std::map<std::string, CommandInfo> commands_;
    std::unordered_set<std::string> switches_;
};

}
