#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "config_path.hpp"
#include "core/auth/auth_store.hpp"
#include "core/session/maintenance_sweeper.hpp"
#include "core/session/session_manager.hpp"
#include "events/event_relay.hpp"
#include "events/pairing_renderer.hpp"
#include "events/webhook_client.hpp"
#include "http/beast_http_client.hpp"
#include "server/health_service.hpp"
#include "server/session_service_impl.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/mysql_auth_store.hpp"
#include "thread_pool/config.hpp"
#include "thread_pool/thread_pool.hpp"
#include "transport/grpc_transport.hpp"

#include <cstdlib>
#include <csignal>
#include <chrono>
#include <filesystem>
#include <grpcpp/grpcpp.h>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
}

// 相对路径不存在时退回到源码树中的 config 目录
std::string ResolveThreadPoolConfig(const std::string& configured) {
    if (!configured.empty() && std::filesystem::exists(configured)) {
        return configured;
    }
    return relay::common::GetThreadPoolConfigPath();
}

// MySQL 启用且可连接时使用数据库, 否则使用文件存储
std::shared_ptr<relay::core::AuthStore> CreateAuthStore(const relay::common::StorageConfig& config) {
    if (config.mysql.enabled) {
        auto pool = std::make_shared<relay::storage::ConnectionPool>(
            relay::storage::Options::FromConfig(config.mysql));
        auto warmup = pool->Warmup();
        if (warmup.IsOk()) {
            auto store = std::make_shared<relay::storage::MySqlAuthStore>(std::move(pool));
            auto schema = store->EnsureSchema();
            if (schema.IsOk()) {
                RELAY_LOG_INFO("Credential store: MySQL {}:{}/{}", config.mysql.host, config.mysql.port,
                               config.mysql.database);
                return store;
            }
            RELAY_LOG_ERROR("Failed to prepare credential table: {}", schema.Message());
        } else {
            RELAY_LOG_ERROR("Failed to initialize MySQL connection: {}", warmup.Message());
        }
        RELAY_LOG_WARN("Falling back to file credential store");
    }
    RELAY_LOG_INFO("Credential store: directory {}", config.auth_dir);
    return std::make_shared<relay::core::FileAuthStore>(config.auth_dir);
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (const char* env = std::getenv("RELAY_SERVER_CONFIG")) {
        config_path = env;
    } else {
        config_path = relay::common::GetConfigPath("app.example.json");
    }

    relay::common::AppConfig config;
    try {
        config = relay::common::ConfigLoader::Load(config_path);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    relay::common::InitLogger(config.logging);
    RELAY_LOG_INFO("Relay server starting with config {}", config_path);
    if (config.webhook.url.empty()) {
        RELAY_LOG_WARN("webhook.url is not configured; inbound messages will not be relayed");
    }

    const auto thread_pool_config = ResolveThreadPoolConfig(config.thread_pool.config_path);

    // 事件转发与健康检查共用的后台线程池
    auto loader = thread_pool::ThreadPoolConfigLoader::FromFile(thread_pool_config);
    thread_pool::ThreadPool relay_pool(loader ? loader->GetConfig() : thread_pool::ThreadPoolConfig{});
    relay_pool.Start();

    auto http_client = std::make_shared<relay::http::BeastHttpClient>();
    auto webhook = std::make_shared<relay::events::WebhookClient>(http_client, config.webhook);
    auto assets = std::make_shared<relay::events::AssetStorageClient>(
        http_client, config.asset_storage, config.webhook.secret, config.webhook.url);
    auto event_relay = std::make_shared<relay::events::EventRelay>(
        webhook, assets, &relay_pool, config.webhook.source, config.asset_storage.key_prefix);

    auto bridge_channel = grpc::CreateChannel(config.transport.bridge_address, grpc::InsecureChannelCredentials());
    auto transport_factory = std::make_shared<relay::transport::GrpcTransportFactory>(
        bridge_channel, std::chrono::milliseconds(config.transport.rpc_timeout_ms));
    RELAY_LOG_INFO("Transport bridge at {}", config.transport.bridge_address);

    auto manager = std::make_shared<relay::core::SessionManager>(
        config.sessions,
        CreateAuthStore(config.storage),
        transport_factory,
        std::make_shared<relay::events::TextPairingRenderer>(),
        event_relay);

    relay::core::MaintenanceSweeper sweeper(*manager, std::chrono::seconds(config.sessions.sweep_interval_seconds));
    sweeper.Start();

    relay::server::SessionServiceImpl session_service(manager, config.auth.secret, thread_pool_config);
    relay::server::HealthServiceImpl health_service(relay_pool, manager);

    grpc::ServerBuilder builder;
    std::string address = config.server.host + ":" + std::to_string(config.server.port);
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&session_service);
    builder.RegisterService(&health_service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        RELAY_LOG_ERROR("Failed to start gRPC server on {}", address);
        sweeper.Stop();
        manager->Shutdown();
        relay_pool.Stop();
        relay::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    RELAY_LOG_INFO("Relay server listening on {} (max sessions {})",
                   address, config.sessions.max_concurrent_sessions);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::thread shutdown_thread([&server]() {
        while (g_stop_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        RELAY_LOG_WARN("Signal {} received, shutting down gRPC server...", g_stop_signal);
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    });

    server->Wait();
    shutdown_thread.join();

    // 先停清理任务, 再停会话驱动, 最后排空转发任务
    sweeper.Stop();
    manager->Shutdown();
    relay_pool.Stop(thread_pool::StopMode::Graceful);
    RELAY_LOG_INFO("Relay server stopped");
    relay::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
