#pragma once

#include "thread_pool/fwd.hpp"

#include <spdlog/logger.h>

#include <memory>
#include <utility>

namespace thread_pool::log {

// Get/Set the pool logger. LoadLogger never returns null.
LoggerPtr LoadLogger();
void SetLogger(LoggerPtr lg);
bool LoggerIsReady() noexcept;

namespace detail {
    template <typename... Args>
    inline void Log(spdlog::level::level_enum level
                    , fmt::format_string<Args...> fmt
                    , Args&&... args) {
        auto lg = ::thread_pool::log::LoadLogger();
        if (lg && lg->should_log(level)) {
            lg->log(level, fmt, std::forward<Args>(args)...);
        }
    }
}
}

// Logging macros
#define TP_LOG_TRACE(...) ::thread_pool::log::detail::Log(spdlog::level::trace, __VA_ARGS__)
#define TP_LOG_DEBUG(...) ::thread_pool::log::detail::Log(spdlog::level::debug, __VA_ARGS__)
#define TP_LOG_INFO(...) ::thread_pool::log::detail::Log(spdlog::level::info,  __VA_ARGS__)
#define TP_LOG_WARN(...) ::thread_pool::log::detail::Log(spdlog::level::warn,  __VA_ARGS__)
#define TP_LOG_ERROR(...) ::thread_pool::log::detail::Log(spdlog::level::err,   __VA_ARGS__)
