#include "core/session/maintenance_sweeper.hpp"

#include "common/logger.hpp"

namespace relay {
namespace core {

MaintenanceSweeper::MaintenanceSweeper(SessionManager& manager, std::chrono::milliseconds interval)
    : manager_(manager), interval_(interval) {}

MaintenanceSweeper::~MaintenanceSweeper() {
    Stop();
}

void MaintenanceSweeper::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stop_ = false;
    worker_ = std::thread([this] { Loop(); });
    RELAY_LOG_INFO("Maintenance sweeper started, interval {}ms", interval_.count());
}

void MaintenanceSweeper::Stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        worker = std::move(worker_);
    }
    cv_.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

std::size_t MaintenanceSweeper::Runs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_;
}

void MaintenanceSweeper::Loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_; })) {
            return;
        }
        lock.unlock();
        RELAY_LOG_INFO("Running automatic cleanup check ({} sessions, {} pending pairings)",
                       manager_.ActiveSessions(), manager_.PendingPairings());
        manager_.SweepStranded();
        lock.lock();
        ++runs_;
    }
}

}
}
