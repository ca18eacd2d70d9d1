#pragma once

#include <stdexcept>
#include <string>

namespace dm::storage {

struct WriteError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
