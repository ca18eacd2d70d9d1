#include "concurrency/Interrupt.hpp"

using namespace dm::concurrency;

void Interrupt::trigger() {
    {
        std::scoped_lock lock(mtx_);
        triggered_ = true;
    }
    cv_.notify_all();
}

void Interrupt::reset() {
    std::scoped_lock lock(mtx_);
    triggered_ = false;
}

bool Interrupt::triggered() const {
    std::scoped_lock lock(mtx_);
    return triggered_;
}

void Interrupt::poke() {
    { std::scoped_lock lock(mtx_); }
    cv_.notify_all();
}

bool Interrupt::waitFor(const std::chrono::milliseconds timeout, const std::function<bool()>& wakeWhen) {
    std::unique_lock lock(mtx_);
    cv_.wait_for(lock, timeout, [&] { return triggered_ || (wakeWhen && wakeWhen()); });
    return triggered_;
}
