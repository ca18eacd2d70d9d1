#pragma once

#include <stdexcept>
#include <string>

namespace dm::errors {

// Unknown filestore or document id
struct NotFound : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Document is already claimed by another upload attempt
struct Conflict : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
