#pragma once

#include "transport/transport.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay {
namespace events {

// 单个会话的通讯录缓存, 由传输层的联系人事件维护
class ContactDirectory {
public:
    // 插入或整体替换
    void Upsert(const std::vector<transport::Contact>& contacts);
    // 仅合并到已存在的条目, 空字段不覆盖
    void Merge(const std::vector<transport::Contact>& updates);

    std::optional<transport::Contact> Find(const std::string& id) const;
    std::size_t Size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, transport::Contact> contacts_;
};

}
}
