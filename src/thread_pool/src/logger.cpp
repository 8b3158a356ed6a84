#include "thread_pool/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <mutex>

namespace thread_pool::log {
namespace {

LoggerPtr g_logger; // installed logger, empty until SetLogger or first use
std::mutex g_logger_mtx;

constexpr const char* kDefaultName = "thread-pool";

// Build the fallback console logger used before the host installs its own
LoggerPtr BuildDefault() {
    if (auto existing = spdlog::get(kDefaultName)) {
        return existing;
    }
    auto logger = std::make_shared<spdlog::logger>(
        kDefaultName, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    logger->set_level(spdlog::level::info);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v");
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}

LoggerPtr LoadLogger() {
    if (auto current = std::atomic_load_explicit(&g_logger, std::memory_order_acquire)) {
        return current;
    }
    std::lock_guard<std::mutex> lk(g_logger_mtx);
    if (auto current = std::atomic_load_explicit(&g_logger, std::memory_order_relaxed)) {
        return current;
    }
    auto logger = BuildDefault();
    std::atomic_store_explicit(&g_logger, logger, std::memory_order_release);
    return logger;
}

// Passing nullptr detaches the host logger; the next LoadLogger rebuilds the default
void SetLogger(LoggerPtr logger) {
    std::lock_guard<std::mutex> lk(g_logger_mtx);
    std::atomic_store_explicit(&g_logger, std::move(logger), std::memory_order_release);
}

bool LoggerIsReady() noexcept {
    return std::atomic_load_explicit(&g_logger, std::memory_order_acquire) != nullptr;
}

}
