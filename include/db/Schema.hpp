#pragma once

#include <string>

namespace dm::db {

// Idempotent create-if-missing for the docmirror tables. Runs on its own
// connection because the pooled connections prepare statements against them.
struct Schema {
    static void init(const std::string& connectionString);
};

}
