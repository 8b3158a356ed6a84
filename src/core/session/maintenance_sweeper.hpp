#pragma once

#include "core/session/session_manager.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace relay {
namespace core {

// 周期性回收滞留会话
class MaintenanceSweeper {
public:
    MaintenanceSweeper(SessionManager& manager, std::chrono::milliseconds interval);
    ~MaintenanceSweeper();

    MaintenanceSweeper(const MaintenanceSweeper&) = delete;
    MaintenanceSweeper& operator=(const MaintenanceSweeper&) = delete;

    void Start();
    void Stop();

    std::size_t Runs() const;

private:
    void Loop();

    SessionManager& manager_;
    const std::chrono::milliseconds interval_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::size_t runs_ = 0;
    std::thread worker_;
};

}
}
