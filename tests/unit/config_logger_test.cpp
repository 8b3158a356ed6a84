#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "thread_pool/logger.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace {

// 每个用例独占一个临时目录, 析构时删除
class ScratchDir {
public:
    ScratchDir() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = std::filesystem::temp_directory_path() / ("relay_cfg_" + std::to_string(stamp));
        std::filesystem::create_directories(root_);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }
    const std::filesystem::path& Root() const { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace

class ConfigLoaderTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"WEBHOOK_URL", "MICROSERVICE_SECRET", "TRANSPORT_BRIDGE_ADDRESS"}) {
            unsetenv(name);
        }
    }

    std::string Write(const std::string& json) {
        const auto path = scratch_.Root() / "app.json";
        std::ofstream(path) << json;
        return path.string();
    }

    ScratchDir scratch_;
};

TEST_F(ConfigLoaderTest, LoadsLoggingConfig) {
    const std::string config_json = R"({
        "logging": {
            "level": "debug",
            "pattern": "[%H:%M:%S] %v",
            "console": false,
            "file": "temp/logs/server.log",
            "integrate_thread_pool_logger": true
        },
        "thread_pool": {
            "config_path": "custom/thread_pool.json"
        }
    })";
    auto cfg = relay::common::ConfigLoader::Load(Write(config_json));
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.pattern, "[%H:%M:%S] %v");
    EXPECT_FALSE(cfg.logging.console);
    EXPECT_EQ(cfg.logging.file, "temp/logs/server.log");
    EXPECT_TRUE(cfg.logging.integrate_thread_pool_logger);
    EXPECT_EQ(cfg.thread_pool.config_path, "custom/thread_pool.json");
}

// 会话参数缺省值与覆盖
TEST_F(ConfigLoaderTest, SessionDefaultsAndOverrides) {
    const std::string config_json = R"({
        // 注释应被忽略
        "sessions": {
            "max_concurrent_sessions": 2,
            "pairing_timeout_seconds": 30
        },
        "storage": {
            "auth_dir": "/tmp/creds",
            "mysql": { "enabled": true, "database": "relay_test" }
        }
    })";
    auto cfg = relay::common::ConfigLoader::Load(Write(config_json));
    EXPECT_EQ(cfg.sessions.max_concurrent_sessions, 2);
    EXPECT_EQ(cfg.sessions.pairing_timeout_seconds, 30);
    EXPECT_EQ(cfg.sessions.max_reconnect_attempts, 5);
    EXPECT_EQ(cfg.sessions.reconnect_base_delay_ms, 2000);
    EXPECT_EQ(cfg.sessions.reconnect_max_delay_ms, 10000);
    EXPECT_EQ(cfg.sessions.sweep_interval_seconds, 300);
    EXPECT_EQ(cfg.webhook.source, "whatsapp_personal");
    EXPECT_EQ(cfg.asset_storage.bucket, "whatsapp-media");
    EXPECT_EQ(cfg.storage.auth_dir, "/tmp/creds");
    EXPECT_TRUE(cfg.storage.mysql.enabled);
    EXPECT_EQ(cfg.storage.mysql.database, "relay_test");
    EXPECT_EQ(cfg.storage.mysql.port, 3306);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const auto path = Write(R"({"webhook": {"url": "http://file"}, "auth": {"secret": "file"},
                                "transport": {"bridge_address": "bridge:1"}})");
    setenv("WEBHOOK_URL", "https://env.example/functions/v1/hook", 1);
    setenv("MICROSERVICE_SECRET", "env-secret", 1);

    auto cfg = relay::common::ConfigLoader::Load(path);
    EXPECT_EQ(cfg.webhook.url, "https://env.example/functions/v1/hook");
    EXPECT_EQ(cfg.auth.secret, "env-secret");
    EXPECT_EQ(cfg.transport.bridge_address, "bridge:1");
}

TEST_F(ConfigLoaderTest, MissingFileThrows) {
    EXPECT_THROW(relay::common::ConfigLoader::Load("/nonexistent/relay.json"), std::runtime_error);
}

class LoggerInitTest : public ::testing::Test {
protected:
    void TearDown() override { relay::common::ShutdownLogger(); }

    static relay::common::LoggingConfig Quiet(const std::string& level) {
        relay::common::LoggingConfig config;
        config.console = false;
        config.level = level;
        return config;
    }

    ScratchDir scratch_;
};

TEST_F(LoggerInitTest, FileSinkCreatesDirectoriesAndSharesPoolLogger) {
    const auto log_file = scratch_.Root() / "nested" / "relay.log";
    auto config = Quiet("warn");
    config.pattern = "[test] %v";
    config.file = log_file.string();
    config.integrate_thread_pool_logger = true;

    relay::common::InitLogger(config);
    auto logger = relay::common::GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::warn);

    RELAY_LOG_WARN("written to file");
    logger->flush();
    EXPECT_TRUE(std::filesystem::exists(log_file));
    EXPECT_EQ(logger, thread_pool::log::LoadLogger());
}

TEST_F(LoggerInitTest, LevelNamesAreCaseInsensitive) {
    relay::common::InitLogger(Quiet("WARNING"));
    EXPECT_EQ(relay::common::GetLogger()->level(), spdlog::level::warn);
    relay::common::ShutdownLogger();

    relay::common::InitLogger(Quiet("Error"));
    EXPECT_EQ(relay::common::GetLogger()->level(), spdlog::level::err);
}

TEST_F(LoggerInitTest, UnknownLevelFallsBackToInfo) {
    relay::common::InitLogger(Quiet("not-a-level"));
    EXPECT_EQ(relay::common::GetLogger()->level(), spdlog::level::info);
}
