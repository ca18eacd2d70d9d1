#pragma once

#include "concurrency/Interrupt.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace dm::concurrency {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    virtual void restart();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    Interrupt interrupt_;
    std::thread worker_;
    std::mutex lifecycleMutex_;                 // serializes start() and stop()

    [[nodiscard]] bool interrupted() const { return interrupt_.triggered(); }

    virtual void runLoop() = 0;
};

}
