#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace relay {
namespace core {

// 每个账号一份不透明的凭证数据
class AuthStore {
public:
    virtual ~AuthStore() = default;

    // 不存在时返回 std::nullopt
    virtual common::StatusOr<std::optional<std::string>> Load(const std::string& account_id) = 0;
    virtual common::Status Save(const std::string& account_id, const std::string& blob) = 0;
    // 删除不存在的凭证视为成功
    virtual common::Status Remove(const std::string& account_id) = 0;
};

class InMemoryAuthStore : public AuthStore {
public:
    common::StatusOr<std::optional<std::string>> Load(const std::string& account_id) override;
    common::Status Save(const std::string& account_id, const std::string& blob) override;
    common::Status Remove(const std::string& account_id) override;

    bool Contains(const std::string& account_id) const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::string> blobs_;
};

// <root>/<account_id>/creds.json
class FileAuthStore : public AuthStore {
public:
    explicit FileAuthStore(std::filesystem::path root);

    common::StatusOr<std::optional<std::string>> Load(const std::string& account_id) override;
    common::Status Save(const std::string& account_id, const std::string& blob) override;
    common::Status Remove(const std::string& account_id) override;

    const std::filesystem::path& Root() const {
        return root_;
    }

private:
    std::filesystem::path AccountDir(const std::string& account_id) const;

    std::filesystem::path root_;
    std::mutex mutex_;  // 串行化同一进程内的写入
};

// 账号 id 用作目录名, 拒绝路径分隔符与 "." ".."
bool IsValidAccountId(const std::string& account_id);

}
}
