#include "cli/Commands.hpp"
#include "cli/Router.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "runtime/Deps.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <string>
#include <vector>

using namespace dm;

int main(int argc, char** argv) {
    std::vector<std::string> args;
    std::string configPath;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) configPath = argv[++i];
        else if (arg.starts_with("--config=")) configPath = arg.substr(9);
        else args.push_back(arg);
    }

    if (args.empty() || args.front() == "--help" || args.front() == "-h") args = {"help"};

    cli::Router router;
    cli::registerCommands(router);

    try {
        if (configPath.empty()) config::ConfigRegistry::init();
        else config::ConfigRegistry::init(configPath);

        const auto& cfg = config::ConfigRegistry::get();
        log::Registry::init(cfg.logging.log_dir, cfg.logging);

        if (router.contains(args.front()) && !cli::isOffline(args.front())) runtime::Deps::init();
    } catch (const std::exception& e) {
        fmt::print(stderr, "docmirror: failed to initialize: {}\n", e.what());
        return EXIT_FAILURE;
    }

    const auto result = router.execute(args);
    if (!result.stdout_text.empty()) fmt::print("{}", result.stdout_text);
    if (!result.stderr_text.empty()) fmt::print(stderr, "{}", result.stderr_text);

    runtime::Deps::shutdown();
    return result.exit_code;
}
