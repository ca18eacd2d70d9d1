#include "cli/Router.hpp"
#include "errors/errors.hpp"
#include "errors/RemoteError.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>

using namespace dm::cli;

CommandResult dm::cli::invalid(std::string msg) {
    return {exit_code::USAGE, "", std::move(msg) + "\n"};
}

CommandResult dm::cli::ok(std::string out) {
    return {exit_code::OK, std::move(out), ""};
}

CommandResult dm::cli::okJson(const nlohmann::json& data) {
    return ok(data.dump(2) + "\n");
}

std::optional<std::string> dm::cli::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options)
        if (k == key) return v;
    return std::nullopt;
}

bool dm::cli::hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& o : c.options)
        if (o.key == key) return true;
    return false;
}

std::optional<unsigned int> dm::cli::parseUInt(const std::string& s) {
    if (s.empty() || s.size() > 9 || !std::all_of(s.begin(), s.end(), ::isdigit)) return std::nullopt;
    return static_cast<unsigned int>(std::stoul(s));
}

void Router::registerCommand(const std::string& name, std::string usage, std::string description, CommandHandler handler) {
    if (commands_.contains(name)) {
        log::Registry::cli()->warn("[Router] Command '{}' registered twice; keeping the first", name);
        return;
    }
    commands_[name] = CommandInfo{std::move(usage), std::move(description), std::move(handler)};
}

CommandCall Router::parse(const std::vector<std::string>& args) const {
    CommandCall call;
    if (args.empty()) return call;
    call.name = args.front();

    for (size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (!boost::algorithm::starts_with(arg, "--") || arg.size() == 2) {
            call.positionals.push_back(arg);
            continue;
        }

        auto key = arg.substr(2);
        if (const auto eq = key.find('='); eq != std::string::npos) {
            call.options.push_back({key.substr(0, eq), key.substr(eq + 1)});
            continue;
        }

        if (!switches_.contains(key) && i + 1 < args.size() && !boost::algorithm::starts_with(args[i + 1], "--"))
            call.options.push_back({key, args[++i]});
        else call.options.push_back({key, std::nullopt});
    }

    return call;
}

CommandResult Router::execute(const std::vector<std::string>& args) const {
    const auto call = parse(args);
    if (call.name.empty()) return invalid(help());

    const auto it = commands_.find(call.name);
    if (it == commands_.end()) return invalid(fmt::format("Unknown command '{}'\n\n{}", call.name, help()));

    log::Registry::cli()->debug("[Router] Executing '{}' with {} positional(s)", call.name, call.positionals.size());

    try {
        return it->second.handler(call);
    } catch (const errors::NotFound& e) {
        return {exit_code::NOT_FOUND, "", fmt::format("{}\n", e.what())};
    } catch (const errors::Conflict& e) {
        return {exit_code::CONFLICT, "", fmt::format("{}\n", e.what())};
    } catch (const remote::NotFound& e) {
        return {exit_code::NOT_FOUND, "", fmt::format("Remote resource not found: {}\n", e.what())};
    } catch (const std::invalid_argument& e) {
        return invalid(fmt::format("{}\nusage: docmirror {}", e.what(), it->second.usage));
    } catch (const remote::Error& e) {
        log::Registry::cli()->error("[Router] '{}' failed on a remote call (HTTP {}): {}", call.name, e.status(), e.what());
        return {exit_code::FAILURE, "", fmt::format("Remote error: {}\n", e.what())};
    } catch (const std::exception& e) {
        log::Registry::cli()->error("[Router] '{}' failed: {}", call.name, e.what());
        return {exit_code::FAILURE, "", fmt::format("Error: {}\n", e.what())};
    }
}

std::string Router::help() const {
    std::string out = "usage: docmirror [--config <path>] <command> [args]\n\ncommands:\n";
    for (const auto& [name, info] : commands_)
        out += fmt::format("  {:<58} {}\n", info.usage, info.description);
    return out;
}
