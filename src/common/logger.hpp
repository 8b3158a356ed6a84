#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>

namespace relay {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 日志宏定义
#define RELAY_LOG_DEBUG(...) ::relay::common::GetLogger()->debug(__VA_ARGS__)
#define RELAY_LOG_INFO(...)  ::relay::common::GetLogger()->info(__VA_ARGS__)
#define RELAY_LOG_WARN(...)  ::relay::common::GetLogger()->warn(__VA_ARGS__)
#define RELAY_LOG_ERROR(...) ::relay::common::GetLogger()->error(__VA_ARGS__)

}
}