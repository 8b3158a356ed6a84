#include "core/session/session.hpp"
#include "core/session/session_registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace relay::core;

namespace {
std::shared_ptr<Session> MakeSession(const std::string& id, std::uint64_t generation = 1) {
    return std::make_shared<Session>(id, generation, 8);
}
} // namespace

// 每个账号最多一条记录
TEST(SessionRegistryTest, InstallRejectsDuplicateAccount) {
    SessionRegistry registry;
    auto first = MakeSession("agent-1", 1);
    EXPECT_TRUE(registry.Install(first));
    EXPECT_FALSE(registry.Install(MakeSession("agent-1", 2)));
    EXPECT_EQ(registry.Find("agent-1"), first);
    EXPECT_EQ(registry.Size(), 1u);
}

// 只删除预期的那条记录
TEST(SessionRegistryTest, RemoveIsCompareAndRemove) {
    SessionRegistry registry;
    auto old_session = MakeSession("agent-1", 1);
    ASSERT_TRUE(registry.Install(old_session));
    ASSERT_TRUE(registry.Remove("agent-1", old_session.get()));

    auto replacement = MakeSession("agent-1", 2);
    ASSERT_TRUE(registry.Install(replacement));
    EXPECT_FALSE(registry.Remove("agent-1", old_session.get()));
    EXPECT_EQ(registry.Find("agent-1"), replacement);
    EXPECT_FALSE(registry.Remove("missing", nullptr));
}

TEST(SessionRegistryTest, CountsByState) {
    SessionRegistry registry;
    auto a = MakeSession("a");
    auto b = MakeSession("b");
    auto c = MakeSession("c");
    ASSERT_TRUE(a->CompareAndSetState(ConnectionState::kConnecting, ConnectionState::kOpen));
    ASSERT_TRUE(b->CompareAndSetState(ConnectionState::kConnecting, ConnectionState::kOpen));
    ASSERT_TRUE(registry.Install(a));
    ASSERT_TRUE(registry.Install(b));
    ASSERT_TRUE(registry.Install(c));

    EXPECT_EQ(registry.CountInState(ConnectionState::kOpen), 2u);
    EXPECT_EQ(registry.CountInState(ConnectionState::kOpen, "a"), 1u);
    EXPECT_EQ(registry.CountInState(ConnectionState::kConnecting), 1u);
    EXPECT_EQ(registry.Snapshot().size(), 3u);
}

// 同一账号互斥, 不同账号互不阻塞
TEST(SessionRegistryTest, AccountLockSerializesSameAccount) {
    SessionRegistry registry;
    std::atomic<bool> entered{false};
    std::thread waiter;
    {
        auto guard = registry.LockAccount("agent-1");
        waiter = std::thread([&] {
            auto inner = registry.LockAccount("agent-1");
            entered.store(true);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        EXPECT_FALSE(entered.load());
        auto other = registry.LockAccount("agent-2");
        EXPECT_EQ(registry.LockCount(), 2u);
    }
    waiter.join();
    EXPECT_TRUE(entered.load());
    EXPECT_EQ(registry.LockCount(), 0u);
}

// 无人持有的账号锁被回收, 未知账号不会让锁表增长
TEST(SessionRegistryTest, UnusedAccountLocksAreReclaimed) {
    SessionRegistry registry;
    for (int i = 0; i < 100; ++i) {
        auto guard = registry.LockAccount("ghost-" + std::to_string(i));
        EXPECT_EQ(registry.LockCount(), 1u);
    }
    EXPECT_EQ(registry.LockCount(), 0u);

    auto session = MakeSession("agent-1");
    {
        auto guard = registry.LockAccount("agent-1");
        ASSERT_TRUE(registry.Install(session));
    }
    EXPECT_EQ(registry.LockCount(), 0u);
    {
        auto guard = registry.LockAccount("agent-1");
        EXPECT_TRUE(registry.Remove("agent-1", session.get()));
    }
    EXPECT_EQ(registry.LockCount(), 0u);
}

// 配对码只在 PairingPending 下有效, 离开该状态即清除
TEST(SessionTest, PairingArtifactFollowsState) {
    auto session = MakeSession("agent-1");
    PairingArtifact artifact{"agent-1", "CODE", std::chrono::system_clock::now()};
    EXPECT_FALSE(session->SetPairingArtifact(artifact, Session::Clock::now()));

    ASSERT_TRUE(session->CompareAndSetState(ConnectionState::kConnecting, ConnectionState::kPairingPending));
    const auto first = Session::Clock::now() + std::chrono::seconds(5);
    EXPECT_TRUE(session->SetPairingArtifact(artifact, first));
    EXPECT_TRUE(session->Artifact().has_value());
    EXPECT_EQ(session->PairingDeadline(), first);

    // 新的配对码替换截止时间
    artifact.rendered_code = "CODE-2";
    const auto second = first + std::chrono::seconds(5);
    EXPECT_TRUE(session->SetPairingArtifact(artifact, second));
    EXPECT_EQ(session->PairingDeadline(), second);
    EXPECT_EQ(session->Artifact()->rendered_code, "CODE-2");

    ASSERT_TRUE(session->CompareAndSetState(ConnectionState::kPairingPending, ConnectionState::kOpen));
    EXPECT_FALSE(session->Artifact().has_value());
}

// 销毁只生效一次, 之后拒绝状态变化与新传输
TEST(SessionTest, TeardownIsOneShot) {
    auto session = MakeSession("agent-1");
    std::shared_ptr<relay::transport::Transport> previous;
    auto epoch = session->InstallTransport(nullptr, previous);
    ASSERT_TRUE(epoch.has_value());

    std::shared_ptr<relay::transport::Transport> taken;
    EXPECT_TRUE(session->BeginTeardown(taken));
    EXPECT_FALSE(session->BeginTeardown(taken));
    EXPECT_TRUE(session->TornDown());
    EXPECT_TRUE(session->StopRequested());
    EXPECT_TRUE(session->Channel()->Closed());
    EXPECT_FALSE(session->CompareAndSetState(ConnectionState::kClosing, ConnectionState::kConnecting));
    EXPECT_FALSE(session->InstallTransport(nullptr, previous).has_value());
    EXPECT_NE(session->TransportEpoch(), *epoch);
}

// init 结果只接受第一次
TEST(SessionTest, InitOutcomeResolvesOnce) {
    auto session = MakeSession("agent-1");
    auto future = session->TakeInitFuture();
    InitResult result;
    result.connected = true;
    EXPECT_TRUE(session->ResolveInit(relay::common::StatusOr<InitResult>(result)));
    EXPECT_FALSE(session->ResolveInit(relay::common::Status::Unavailable("late")));
    EXPECT_TRUE(session->InitResolved());
    auto outcome = future.get();
    ASSERT_TRUE(outcome.IsOk());
    EXPECT_TRUE(outcome.Value().connected);
}

// WaitForStop 被销毁唤醒
TEST(SessionTest, WaitForStopWakesOnTeardown) {
    auto session = MakeSession("agent-1");
    EXPECT_FALSE(session->WaitForStop(std::chrono::milliseconds(5)));

    std::thread waiter([&] { EXPECT_TRUE(session->WaitForStop(std::chrono::seconds(10))); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    std::shared_ptr<relay::transport::Transport> taken;
    session->BeginTeardown(taken);
    waiter.join();
}
