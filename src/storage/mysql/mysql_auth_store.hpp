#pragma once

#include "core/auth/auth_store.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace relay {
namespace storage {

// 凭证存入 account_credentials 表, 每个账号一行
class MySqlAuthStore : public core::AuthStore {
public:
    explicit MySqlAuthStore(std::shared_ptr<ConnectionPool> pool);

    // 表不存在时创建
    common::Status EnsureSchema();

    common::StatusOr<std::optional<std::string>> Load(const std::string& account_id) override;
    common::Status Save(const std::string& account_id, const std::string& blob) override;
    common::Status Remove(const std::string& account_id) override;

private:
    std::shared_ptr<ConnectionPool> pool_;
};

}
}
