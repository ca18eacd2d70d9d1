#pragma once

#include "concurrency/Interrupt.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace dm::concurrency {

struct PollPolicy {
    std::chrono::milliseconds interval{5000};
    unsigned int max_attempts{120};
    double backoff{1.0};                          // multiplier applied to the interval after each attempt
    std::chrono::milliseconds max_interval{60000};
};

struct PollTimeout : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Interrupted : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Calls fn after each wait until it yields a value. Throws PollTimeout once
// max_attempts calls came back empty, Interrupted when the interrupt fires.
template <typename Fn>
auto awaitCompletion(Fn&& fn, const PollPolicy& policy, Interrupt* interrupt = nullptr)
    -> typename std::invoke_result_t<Fn&>::value_type {
    auto interval = policy.interval;

    for (unsigned int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        if (interrupt) {
            if (interrupt->waitFor(interval)) throw Interrupted("Polling interrupted");
        } else if (interval.count() > 0) std::this_thread::sleep_for(interval);

        if (auto result = fn()) return std::move(*result);

        if (policy.backoff > 1.0) {
            const auto next = std::chrono::milliseconds(static_cast<long long>(interval.count() * policy.backoff));
            interval = std::min(next, policy.max_interval);
        }
    }

    throw PollTimeout("Gave up after " + std::to_string(policy.max_attempts) + " poll attempts");
}

}
