#include "common/config_loader.hpp"

#include "config_path.hpp"
#include "common/logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace relay {
namespace common {

namespace {
AppConfig g_config;
std::once_flag g_config_once;

// 环境变量优先, 否则使用仓库内示例配置
std::string DetectConfigPath() {
    if (const char* env = std::getenv("RELAY_SERVER_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

void OverrideFromEnv(const char* name, std::string& target) {
    if (const char* env = std::getenv(name)) {
        target = env;
    }
}

// 缺省的键保持结构体默认值
template <typename T>
void Assign(const nlohmann::json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

template <typename Fn>
void ForSection(const nlohmann::json& parent, const char* name, Fn&& fn) {
    auto it = parent.find(name);
    if (it != parent.end() && it->is_object()) {
        fn(*it);
    }
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    auto config = FromJson(json);
    ApplyEnvOverrides(config);
    return config;
}

AppConfig ConfigLoader::LoadFromEnvOrDefault() {
    return Load(DetectConfigPath());
}

void ConfigLoader::ApplyEnvOverrides(AppConfig& config) {
    OverrideFromEnv("WEBHOOK_URL", config.webhook.url);
    OverrideFromEnv("WEBHOOK_SECRET", config.webhook.secret);
    OverrideFromEnv("CONNECT_NOTIFY_URL", config.webhook.connect_notify_url);
    OverrideFromEnv("MICROSERVICE_SECRET", config.auth.secret);
    OverrideFromEnv("TRANSPORT_BRIDGE_ADDRESS", config.transport.bridge_address);
}

const AppConfig& GlobalConfig() {
    std::call_once(g_config_once, [] {
        g_config = ConfigLoader::LoadFromEnvOrDefault();
    });
    return g_config;
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    return nlohmann::json::parse(ifs, nullptr, true, true);
}

AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    ForSection(j, "server", [&](const nlohmann::json& s) {
        Assign(s, "host", cfg.server.host);
        Assign(s, "port", cfg.server.port);
    });
    ForSection(j, "logging", [&](const nlohmann::json& s) {
        Assign(s, "level", cfg.logging.level);
        Assign(s, "pattern", cfg.logging.pattern);
        Assign(s, "console", cfg.logging.console);
        Assign(s, "file", cfg.logging.file);
        Assign(s, "integrate_thread_pool_logger", cfg.logging.integrate_thread_pool_logger);
    });
    ForSection(j, "thread_pool", [&](const nlohmann::json& s) {
        Assign(s, "config_path", cfg.thread_pool.config_path);
    });
    ForSection(j, "auth", [&](const nlohmann::json& s) {
        Assign(s, "secret", cfg.auth.secret);
    });
    ForSection(j, "sessions", [&](const nlohmann::json& s) {
        auto& out = cfg.sessions;
        Assign(s, "max_concurrent_sessions", out.max_concurrent_sessions);
        Assign(s, "pairing_timeout_seconds", out.pairing_timeout_seconds);
        Assign(s, "init_timeout_seconds", out.init_timeout_seconds);
        Assign(s, "max_reconnect_attempts", out.max_reconnect_attempts);
        Assign(s, "reconnect_base_delay_ms", out.reconnect_base_delay_ms);
        Assign(s, "reconnect_max_delay_ms", out.reconnect_max_delay_ms);
        Assign(s, "sweep_interval_seconds", out.sweep_interval_seconds);
        Assign(s, "event_queue_capacity", out.event_queue_capacity);
    });
    ForSection(j, "webhook", [&](const nlohmann::json& s) {
        auto& out = cfg.webhook;
        Assign(s, "url", out.url);
        Assign(s, "secret", out.secret);
        Assign(s, "connect_notify_url", out.connect_notify_url);
        Assign(s, "source", out.source);
        Assign(s, "timeout_ms", out.timeout_ms);
    });
    ForSection(j, "asset_storage", [&](const nlohmann::json& s) {
        auto& out = cfg.asset_storage;
        Assign(s, "base_url", out.base_url);
        Assign(s, "bucket", out.bucket);
        Assign(s, "key_prefix", out.key_prefix);
        Assign(s, "timeout_ms", out.timeout_ms);
    });
    ForSection(j, "transport", [&](const nlohmann::json& s) {
        Assign(s, "bridge_address", cfg.transport.bridge_address);
        Assign(s, "rpc_timeout_ms", cfg.transport.rpc_timeout_ms);
    });
    ForSection(j, "storage", [&](const nlohmann::json& s) {
        Assign(s, "auth_dir", cfg.storage.auth_dir);
        ForSection(s, "mysql", [&](const nlohmann::json& m) {
            auto& out = cfg.storage.mysql;
            Assign(m, "enabled", out.enabled);
            Assign(m, "host", out.host);
            Assign(m, "port", out.port);
            Assign(m, "user", out.user);
            Assign(m, "password", out.password);
            Assign(m, "database", out.database);
            Assign(m, "pool_size", out.pool_size);
            Assign(m, "connection_timeout_ms", out.connection_timeout_ms);
            Assign(m, "read_timeout_ms", out.read_timeout_ms);
            Assign(m, "write_timeout_ms", out.write_timeout_ms);
        });
    });
    return cfg;
}

}
}
