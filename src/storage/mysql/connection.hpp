#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/options.hpp"

#include <mysql/mysql.h>
#include <memory>
#include <string>

namespace relay {
namespace storage {

class Connection {
public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection();

    static common::StatusOr<std::unique_ptr<Connection>> Create(const Options& options);

    // 执行不返回结果集的语句
    common::Status Execute(const std::string& sql);
    // 转义后可直接放入单引号内
    std::string Escape(const std::string& value) const;
    bool Ping() const;

    MYSQL* Raw() const noexcept {return handle_;}
    const Options& GetOptions() const noexcept {return options_;}
private:
    Connection(MYSQL* handle, Options options);

    MYSQL* handle_ = nullptr;
    Options options_;
};

// 带 MySQL 错误信息的 Internal 状态
common::Status MySqlError(const std::string& context, MYSQL* handle);

}
}
