#include "storage/mysql/mysql_auth_store.hpp"
#include "test_mysql_utils.hpp"

#include <gtest/gtest.h>

using relay::storage::MySqlAuthStore;

class MySqlAuthStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = testutils::CreatePoolFromConfig();
        if (!pool_) {
            GTEST_SKIP() << "MySQL disabled in config";
        }
        store_ = std::make_unique<MySqlAuthStore>(pool_);
        auto schema = store_->EnsureSchema();
        ASSERT_TRUE(schema.IsOk()) << schema.Message();
        testutils::ClearCredentialTable(*pool_);
    }

    std::shared_ptr<relay::storage::ConnectionPool> pool_;
    std::unique_ptr<MySqlAuthStore> store_;
};

// 保存后可读取, 再次保存覆盖旧值
TEST_F(MySqlAuthStoreTest, SaveLoadOverwrite) {
    ASSERT_TRUE(store_->Save("agent-1", "{\"v\":1}").IsOk());
    ASSERT_TRUE(store_->Save("agent-1", "{\"v\":2,\"quote\":\"it's\"}").IsOk());

    auto loaded = store_->Load("agent-1");
    ASSERT_TRUE(loaded.IsOk()) << loaded.GetStatus().Message();
    ASSERT_TRUE(loaded.Value().has_value());
    EXPECT_EQ(*loaded.Value(), "{\"v\":2,\"quote\":\"it's\"}");
}

TEST_F(MySqlAuthStoreTest, MissingAccountLoadsEmpty) {
    auto loaded = store_->Load("nobody");
    ASSERT_TRUE(loaded.IsOk()) << loaded.GetStatus().Message();
    EXPECT_FALSE(loaded.Value().has_value());
}

// 删除不存在的记录同样成功
TEST_F(MySqlAuthStoreTest, RemoveIsIdempotent) {
    ASSERT_TRUE(store_->Save("agent-1", "blob").IsOk());
    EXPECT_TRUE(store_->Remove("agent-1").IsOk());
    EXPECT_TRUE(store_->Remove("agent-1").IsOk());
    auto loaded = store_->Load("agent-1");
    ASSERT_TRUE(loaded.IsOk());
    EXPECT_FALSE(loaded.Value().has_value());
}

TEST_F(MySqlAuthStoreTest, RejectsInvalidAccountId) {
    EXPECT_EQ(store_->Save("../x", "blob").Code(), relay::common::StatusCode::kInvalidArgument);
}
