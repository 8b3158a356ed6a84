#include "storage/mysql/mysql_auth_store.hpp"

#include <fmt/format.h>

namespace relay {
namespace storage {

namespace {

common::Status MapMySqlError(MYSQL* conn) {
    unsigned int err = mysql_errno(conn);
    if (err == 2006 || err == 2013) { // server gone / lost connection
        return common::Status::Unavailable(mysql_error(conn));
    }
    return common::Status::Internal(mysql_error(conn));
}

}

MySqlAuthStore::MySqlAuthStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

common::Status MySqlAuthStore::EnsureSchema() {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    const std::string sql =
        "CREATE TABLE IF NOT EXISTS account_credentials ("
        "account_id VARCHAR(128) NOT NULL PRIMARY KEY, "
        "blob_data LONGTEXT NOT NULL, "
        "updated_at TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP ON UPDATE CURRENT_TIMESTAMP"
        ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4";
    if (mysql_real_query(lease.Raw(), sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(lease.Raw());
    }
    return common::Status::OK();
}

common::StatusOr<std::optional<std::string>> MySqlAuthStore::Load(const std::string& account_id) {
    if (!core::IsValidAccountId(account_id)) {
        return common::Status::InvalidArgument("Invalid account id");
    }
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    auto sql = fmt::format(
        "SELECT blob_data FROM account_credentials WHERE account_id = '{}' LIMIT 1",
        lease->Escape(account_id));
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn);
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
        return MapMySqlError(conn);
    }
    auto cleanup = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>(res, mysql_free_result);
    MYSQL_ROW row = mysql_fetch_row(res);
    if (!row || !row[0]) {
        return common::StatusOr<std::optional<std::string>>(std::optional<std::string>());
    }
    unsigned long* lengths = mysql_fetch_lengths(res);
    std::string blob = lengths ? std::string(row[0], lengths[0]) : std::string(row[0]);
    return common::StatusOr<std::optional<std::string>>(std::optional<std::string>(std::move(blob)));
}

common::Status MySqlAuthStore::Save(const std::string& account_id, const std::string& blob) {
    if (!core::IsValidAccountId(account_id)) {
        return common::Status::InvalidArgument("Invalid account id");
    }
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    auto sql = fmt::format(
        "INSERT INTO account_credentials (account_id, blob_data) VALUES ('{}', '{}') "
        "ON DUPLICATE KEY UPDATE blob_data = VALUES(blob_data)",
        lease->Escape(account_id),
        lease->Escape(blob));
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn);
    }
    return common::Status::OK();
}

common::Status MySqlAuthStore::Remove(const std::string& account_id) {
    if (!core::IsValidAccountId(account_id)) {
        return common::Status::InvalidArgument("Invalid account id");
    }
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    auto sql = fmt::format(
        "DELETE FROM account_credentials WHERE account_id = '{}'",
        lease->Escape(account_id));
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn);
    }
    return common::Status::OK();
}

}
}
