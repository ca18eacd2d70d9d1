#pragma once

#include <stdexcept>
#include <string>

namespace dm::remote {

// Any failure talking to the remote store. status is the HTTP code, 0 for transport faults.
class Error : public std::runtime_error {
public:
    Error(const long status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    [[nodiscard]] long status() const { return status_; }

private:
    long status_;
};

class NotFound : public Error {
public:
    explicit NotFound(const std::string& message) : Error(404, message) {}
};

}
