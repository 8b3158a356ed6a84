#include "core/auth/auth_store.hpp"
#include "core/session/maintenance_sweeper.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

using namespace relay::core;
using testutils::FakeTransport;
using testutils::FakeTransportFactory;
using testutils::WaitUntil;

class MaintenanceSweeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        relay::common::SessionsConfig config;
        config.init_timeout_seconds = 2;
        config.reconnect_base_delay_ms = 10000;
        config.reconnect_max_delay_ms = 10000;
        store_ = std::make_shared<InMemoryAuthStore>();
        factory_ = std::make_shared<FakeTransportFactory>(
            [](FakeTransport& t) { t.EmitOpened("5215550001111@s.whatsapp.net"); });
        manager_ = std::make_unique<SessionManager>(config, store_, factory_, nullptr, nullptr);
    }

    void TearDown() override {
        manager_->Shutdown();
    }

    std::shared_ptr<InMemoryAuthStore> store_;
    std::shared_ptr<FakeTransportFactory> factory_;
    std::unique_ptr<SessionManager> manager_;
};

// 周期性运行并回收等待重连的会话
TEST_F(MaintenanceSweeperTest, PeriodicallyReapsStrandedSessions) {
    ASSERT_TRUE(manager_->Init("agent-1").IsOk());
    ASSERT_TRUE(manager_->Init("agent-2").IsOk());
    factory_->LatestFor("agent-1")->EmitClosed(428);
    ASSERT_TRUE(WaitUntil([&] {
        auto status = manager_->Status("agent-1");
        return status.state && *status.state == ConnectionState::kClosing;
    }));

    MaintenanceSweeper sweeper(*manager_, std::chrono::milliseconds(20));
    sweeper.Start();
    EXPECT_TRUE(WaitUntil([&] { return !manager_->Status("agent-1").state.has_value(); }));
    EXPECT_TRUE(WaitUntil([&] { return sweeper.Runs() >= 2; }));
    sweeper.Stop();

    EXPECT_TRUE(manager_->Status("agent-2").connected);
    EXPECT_EQ(manager_->ActiveSessions(), 1u);
}

// Stop 可以提前结束等待, 重复调用无副作用
TEST_F(MaintenanceSweeperTest, StopInterruptsWait) {
    MaintenanceSweeper sweeper(*manager_, std::chrono::hours(1));
    sweeper.Start();
    const auto start = std::chrono::steady_clock::now();
    sweeper.Stop();
    sweeper.Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
    EXPECT_EQ(sweeper.Runs(), 0u);
}
