#pragma once

#include <string>
#include <string_view>

namespace relay {
namespace common {

// 服务器配置结构体
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 50051;
};

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
    bool integrate_thread_pool_logger = false;
};

// 线程池配置路径结构体
struct ThreadPoolConfigPath {
    std::string config_path = "config/thread_pool.json";
};

// 控制面鉴权配置
struct AuthConfig {
    std::string secret = "";
};

// 会话生命周期配置
struct SessionsConfig {
    int max_concurrent_sessions = 5;      // 同时处于 Open 状态的会话上限
    int pairing_timeout_seconds = 180;    // 配对码有效期
    int init_timeout_seconds = 60;        // init 等待首个结果的最长时间
    int max_reconnect_attempts = 5;       // 自动重连次数上限
    int reconnect_base_delay_ms = 2000;   // 重连退避基数
    int reconnect_max_delay_ms = 10000;   // 重连退避上限
    int sweep_interval_seconds = 300;     // 清理任务周期
    int event_queue_capacity = 256;       // 每个会话的事件队列容量
};

// Webhook 配置结构体
struct WebhookConfig {
    std::string url = "";
    std::string secret = "";
    std::string connect_notify_url = "";
    std::string source = "whatsapp_personal";
    int timeout_ms = 10000;
};

// 媒体存储配置结构体
struct AssetStorageConfig {
    std::string base_url = "";
    std::string bucket = "whatsapp-media";
    std::string key_prefix = "whatsapp";
    int timeout_ms = 30000;
};

// 协议桥接 (transport) 配置
struct TransportConfig {
    std::string bridge_address = "127.0.0.1:50061";
    int rpc_timeout_ms = 15000;
};

// Mysql配置结构体
struct MysqlConfig {
    std::string host = "127.0.0.1";
    int port = 3306;
    std::string user = "dev";
    std::string password = "";
    std::string database = "relay";
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int read_timeout_ms = 2000;
    int write_timeout_ms = 2000;
    bool enabled = false;
};

// 存储配置结构体
struct StorageConfig {
    std::string auth_dir = "auth_sessions";
    MysqlConfig mysql;
};

// 应用配置结构体
struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    ThreadPoolConfigPath thread_pool;
    AuthConfig auth;
    SessionsConfig sessions;
    WebhookConfig webhook;
    AssetStorageConfig asset_storage;
    TransportConfig transport;
    StorageConfig storage;
};

}
}
