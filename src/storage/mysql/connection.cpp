#include "storage/mysql/connection.hpp"

#include <algorithm>
#include <vector>

namespace relay {
namespace storage {

namespace {

unsigned int ToSeconds(std::chrono::milliseconds timeout) {
    // MySQL 客户端超时以秒为单位, 至少 1 秒
    return static_cast<unsigned int>(std::max<long long>(1, (timeout.count() + 999) / 1000));
}

}

common::Status MySqlError(const std::string& context, MYSQL* handle) {
    std::string message = context;
    if (handle != nullptr) {
        message += ": ";
        message += mysql_error(handle);
    }
    return common::Status::Internal(message);
}

Connection::Connection(MYSQL* handle, Options options): handle_(handle), options_(std::move(options)) {}

Connection::~Connection() {
    if (handle_ != nullptr) {
        mysql_close(handle_);
        handle_ = nullptr;
    }
}

common::StatusOr<std::unique_ptr<Connection>> Connection::Create(const Options& options) {
    MYSQL* handle = mysql_init(nullptr);
    if (handle == nullptr) {
        return MySqlError("mysql_init failed", nullptr);
    }

    unsigned int connect_timeout_sec = ToSeconds(options.connect_timeout);
    mysql_options(handle, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_sec);
    unsigned int read_timeout_sec = ToSeconds(options.read_timeout);
    mysql_options(handle, MYSQL_OPT_READ_TIMEOUT, &read_timeout_sec);
    unsigned int write_timeout_sec = ToSeconds(options.write_timeout);
    mysql_options(handle, MYSQL_OPT_WRITE_TIMEOUT, &write_timeout_sec);

    if (!mysql_real_connect(handle,
                           options.host.c_str(),
                           options.user.c_str(),
                           options.password.c_str(),
                           options.database.c_str(),
                           options.port,
                           nullptr,
                           0)) {
        common::Status status = MySqlError("mysql_real_connect failed", handle);
        mysql_close(handle);
        return status;
    }

    if (!options.charset.empty() && mysql_set_character_set(handle, options.charset.c_str()) != 0) {
        common::Status status = MySqlError("mysql_set_character_set failed", handle);
        mysql_close(handle);
        return status;
    }

    return common::StatusOr<std::unique_ptr<Connection>>(std::unique_ptr<Connection>(new Connection(handle, options)));
}

common::Status Connection::Execute(const std::string& sql) {
    if (mysql_real_query(handle_, sql.c_str(), sql.size()) != 0) {
        return MySqlError("query failed", handle_);
    }
    return common::Status::OK();
}

std::string Connection::Escape(const std::string& value) const {
    std::vector<char> buffer(value.size() * 2 + 1);
    const auto length = mysql_real_escape_string(handle_, buffer.data(), value.data(),
                                                 static_cast<unsigned long>(value.size()));
    return std::string(buffer.data(), length);
}

bool Connection::Ping() const {
    return mysql_ping(handle_) == 0;
}

}
}
