#pragma once

#include "cli/Router.hpp"

namespace dm::cli {

// Registers every docmirror command. Handlers resolve services through runtime::Deps.
void registerCommands(Router& router);

// Commands that need no database, remote or cache access
[[nodiscard]] bool isOffline(const std::string& command);

}
