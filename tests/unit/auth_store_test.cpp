#include "core/auth/auth_store.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace relay::core;
using relay::common::StatusCode;

TEST(AccountIdTest, RejectsPathLikeIds) {
    EXPECT_TRUE(IsValidAccountId("agent-1"));
    EXPECT_TRUE(IsValidAccountId("5215551234567"));
    EXPECT_FALSE(IsValidAccountId(""));
    EXPECT_FALSE(IsValidAccountId("."));
    EXPECT_FALSE(IsValidAccountId(".."));
    EXPECT_FALSE(IsValidAccountId("a/b"));
    EXPECT_FALSE(IsValidAccountId("a\\b"));
    EXPECT_FALSE(IsValidAccountId(std::string("a\0b", 3)));
}

TEST(InMemoryAuthStoreTest, SaveLoadRemove) {
    InMemoryAuthStore store;
    auto missing = store.Load("agent-1");
    ASSERT_TRUE(missing.IsOk());
    EXPECT_FALSE(missing.Value().has_value());

    ASSERT_TRUE(store.Save("agent-1", "blob-1").IsOk());
    ASSERT_TRUE(store.Save("agent-1", "blob-2").IsOk());
    auto loaded = store.Load("agent-1");
    ASSERT_TRUE(loaded.IsOk());
    ASSERT_TRUE(loaded.Value().has_value());
    EXPECT_EQ(*loaded.Value(), "blob-2");

    EXPECT_TRUE(store.Remove("agent-1").IsOk());
    EXPECT_FALSE(store.Contains("agent-1"));
    // 删除不存在的凭证同样成功
    EXPECT_TRUE(store.Remove("agent-1").IsOk());
}

class FileAuthStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path()
            / ("relay_auth_test_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
};

// 每个账号一个目录, 内容原样保存
TEST_F(FileAuthStoreTest, PersistsAcrossInstances) {
    {
        FileAuthStore store(root_);
        ASSERT_TRUE(store.Save("agent-1", "{\"noise\":\"abc\"}").IsOk());
    }
    EXPECT_TRUE(std::filesystem::exists(root_ / "agent-1" / "creds.json"));

    FileAuthStore reopened(root_);
    auto loaded = reopened.Load("agent-1");
    ASSERT_TRUE(loaded.IsOk());
    ASSERT_TRUE(loaded.Value().has_value());
    EXPECT_EQ(*loaded.Value(), "{\"noise\":\"abc\"}");

    auto missing = reopened.Load("agent-2");
    ASSERT_TRUE(missing.IsOk());
    EXPECT_FALSE(missing.Value().has_value());
}

TEST_F(FileAuthStoreTest, RemoveDeletesAccountDirectory) {
    FileAuthStore store(root_);
    ASSERT_TRUE(store.Save("agent-1", "blob").IsOk());
    ASSERT_TRUE(store.Remove("agent-1").IsOk());
    EXPECT_FALSE(std::filesystem::exists(root_ / "agent-1"));
    EXPECT_TRUE(store.Remove("agent-1").IsOk());
}

TEST_F(FileAuthStoreTest, RejectsInvalidAccountIds) {
    FileAuthStore store(root_);
    auto status = store.Save("../outside", "blob");
    EXPECT_EQ(status.Code(), StatusCode::kInvalidArgument);
    EXPECT_EQ(store.Load("..").GetStatus().Code(), StatusCode::kInvalidArgument);
    EXPECT_FALSE(std::filesystem::exists(root_.parent_path() / "outside" / "creds.json"));
}
