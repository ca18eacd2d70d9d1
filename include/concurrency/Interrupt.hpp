#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace dm::concurrency {

// Interruptible sleep shared between a service and the work it drives
class Interrupt {
public:
    void trigger();
    void reset();
    [[nodiscard]] bool triggered() const;

    // Wakes waiters so they re-check their wake condition
    void poke();

    // Sleeps up to timeout. Returns true when interrupted, false on timeout or when wakeWhen holds.
    bool waitFor(std::chrono::milliseconds timeout, const std::function<bool()>& wakeWhen = {});

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool triggered_{false};
};

}
