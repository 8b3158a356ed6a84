#include "common/logger.hpp"
#include "thread_pool/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace relay {
namespace common {

namespace {

constexpr const char* kLoggerName = "relay_server";

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

// 配置中的级别名到 spdlog 级别, 不区分大小写
spdlog::level::level_enum ParseLevel(const std::string& name, spdlog::level::level_enum fallback) {
    static const std::unordered_map<std::string, spdlog::level::level_enum> kLevels{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"err", spdlog::level::err},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    std::string key;
    key.reserve(name.size());
    for (unsigned char c : name) {
        key.push_back(static_cast<char>(std::tolower(c)));
    }
    auto it = kLevels.find(key);
    if (it != kLevels.end()) {
        return it->second;
    }
    std::fprintf(stderr, "%s: unknown log level \"%s\", using %s\n",
                 kLoggerName, name.c_str(), spdlog::level::to_string_view(fallback).data());
    return fallback;
}

std::vector<spdlog::sink_ptr> BuildSinks(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file.empty()) {
        const std::filesystem::path path{config.file};
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                throw std::runtime_error("Failed to create log directory " +
                                         path.parent_path().string() + ": " + ec.message());
            }
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true));
    }
    if (sinks.empty()) {
        // 控制台与文件都关闭
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }
    return sinks;
}

} // namespace

void InitLogger(const LoggingConfig& config) {
    auto sinks = BuildSinks(config);
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(ParseLevel(config.level, spdlog::level::info));
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        g_logger = logger;
    }

    if (config.integrate_thread_pool_logger) {
        thread_pool::log::SetLogger(logger);
    }
}

void ShutdownLogger() {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        logger = std::move(g_logger);
    }
    if (logger) {
        logger->flush();
    }
    thread_pool::log::SetLogger(nullptr);
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> GetLogger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = spdlog::default_logger();
        if (!g_logger) {
            // spdlog::shutdown() 之后默认日志器为空
            g_logger = std::make_shared<spdlog::logger>(kLoggerName,
                std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
    }
    return g_logger;
}

}
}
